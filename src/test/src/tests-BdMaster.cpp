// tests-BdMaster.cpp
#include "catch2/catch.hpp"

#include "Solver/Benders/BdMaster.h"
#include "test_models.h"
#include "test_solvers.h"

TEST_CASE("Master problem with aggregate cuts") {
    GepParams par;
    GepMessage message(0);
    GepModel * model = createTwoTechModel(1.0, 100.0);
    REQUIRE(model->validate() == GEP_RTN_OK);

    BdMaster master(model, &par, &message);
    REQUIRE(master.init() == GEP_RTN_OK);
    REQUIRE(master.getNumThetas() == 1);

    SECTION("no cuts") {
        REQUIRE(master.solve() == GEP_RTN_OK);
        REQUIRE(master.getStatus() == GEP_STAT_OPTIMAL);
        CHECK(master.getPrimalObjective() == Approx(0.0).margin(1.0e-9));
        CHECK(master.getPrimalSolution()[0] == Approx(0.0).margin(1.0e-9));
        CHECK(master.getTheta()[0] == Approx(0.0).margin(1.0e-9));
    }

    SECTION("optimality and feasibility cuts") {
        double gradient[2] = {-990.0, -950.0};
        REQUIRE(master.addOptimalityCut(100000.0, gradient) == GEP_RTN_OK);
        REQUIRE(master.solve() == GEP_RTN_OK);
        REQUIRE(master.getStatus() == GEP_STAT_OPTIMAL);
        CHECK(master.getPrimalObjective() == Approx(100000.0));
        CHECK(master.getTheta()[0] == Approx(100000.0));

        REQUIRE(master.addFeasibilityCut(0) == GEP_RTN_OK);
        REQUIRE(master.getNumCuts() == 2);
        CHECK(master.getCut(1).type == BD_CUT_FEASIBILITY);
        CHECK(master.getCut(1).intercept == Approx(100.0));
        REQUIRE(master.solve() == GEP_RTN_OK);
        CHECK(master.getPrimalObjective() == Approx(2005000.0));
        CHECK(master.getPrimalSolution()[0] == Approx(0.0).margin(1.0e-9));
        CHECK(master.getPrimalSolution()[1] == Approx(100.0));
    }

    SECTION("same cuts give the same solution") {
        double gradient[2] = {-990.0, -950.0};
        REQUIRE(master.addOptimalityCut(100000.0, gradient) == GEP_RTN_OK);
        REQUIRE(master.solve() == GEP_RTN_OK);
        double obj1 = master.getPrimalObjective();
        double x1 = master.getPrimalSolution()[0];
        REQUIRE(master.solve() == GEP_RTN_OK);
        CHECK(master.getPrimalObjective() == obj1);
        CHECK(master.getPrimalSolution()[0] == x1);
    }

    SECTION("scenario index is rejected for aggregate cuts") {
        double gradient[2] = {0.0, 0.0};
        CHECK(master.addOptimalityCut(1.0, gradient, 0) == GEP_RTN_ERR);
        CHECK(master.addFeasibilityCut(1) == GEP_RTN_ERR);
        CHECK(master.getNumCuts() == 0);
    }

    delete model;
}

TEST_CASE("Master problem with multiple cuts") {
    GepParams par;
    GepMessage message(0);
    par.setBoolParam("BD/MULTI_CUT", true);

    std::string names[1] = {"A"};
    double cost[1] = {1.0};
    double invcost[1] = {10.0};
    double duration[1] = {1.0};
    double prob[2] = {0.25, 0.75};
    double w1[1] = {1.0};
    double w2[1] = {2.0};
    const double * width[2] = {w1, w2};

    GepModel model;
    REQUIRE(model.loadTechnologies(1, names, cost, invcost) == GEP_RTN_OK);
    REQUIRE(model.loadDurations(1, duration) == GEP_RTN_OK);
    REQUIRE(model.loadScenarios(2, prob, width) == GEP_RTN_OK);
    REQUIRE(model.validate() == GEP_RTN_OK);

    BdMaster master(&model, &par, &message);
    REQUIRE(master.init() == GEP_RTN_OK);
    REQUIRE(master.isMultiCut());
    REQUIRE(master.getNumThetas() == 2);

    double gradient[1] = {0.0};
    CHECK(master.addOptimalityCut(100.0, gradient) == GEP_RTN_ERR);
    REQUIRE(master.addOptimalityCut(100.0, gradient, 0) == GEP_RTN_OK);
    REQUIRE(master.addOptimalityCut(200.0, gradient, 1) == GEP_RTN_OK);
    REQUIRE(master.solve() == GEP_RTN_OK);
    REQUIRE(master.getStatus() == GEP_STAT_OPTIMAL);
    CHECK(master.getPrimalObjective() == Approx(175.0));
    CHECK(master.getTheta()[0] == Approx(100.0));
    CHECK(master.getTheta()[1] == Approx(200.0));
}

TEST_CASE("Master problem reporting infeasibility") {
    GepParams par;
    GepMessage message(0);
    GepModel * model = createTwoTechModel();
    REQUIRE(model->validate() == GEP_RTN_OK);

    BdMasterInfeasible master(model, &par, &message);
    REQUIRE(master.init() == GEP_RTN_OK);
    REQUIRE(master.solve() == GEP_RTN_OK);
    CHECK(master.getStatus() == GEP_STAT_PRIM_INFEASIBLE);

    delete model;
}
