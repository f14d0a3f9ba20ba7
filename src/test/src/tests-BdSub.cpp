// tests-BdSub.cpp
#include "catch2/catch.hpp"

#include "Utility/GepMessage.h"
#include "Utility/GepParams.h"
#include "Solver/Benders/BdSub.h"
#include "Solver/Benders/BdCutGen.h"
#include "test_models.h"

TEST_CASE("Dispatch subproblem") {
    GepParams par;
    GepMessage message(0);
    GepModel * model = createTwoTechModel(1.0, 100.0);
    REQUIRE(model->validate() == GEP_RTN_OK);

    BdSub sub(model, &par, &message);
    REQUIRE(sub.init() == GEP_RTN_OK);
    REQUIRE(sub.getNumScenarios() == 1);

    SECTION("no capacity sheds all demand") {
        double x[2] = {0.0, 0.0};
        REQUIRE(sub.solve(x) == GEP_RTN_OK);
        REQUIRE(sub.getStatus(0) == GEP_STAT_OPTIMAL);
        CHECK(sub.getObjective(0) == Approx(100000.0));
        CHECK(sub.getUnservedEnergy(0)[0] == Approx(100.0));
        CHECK(sub.getDemandDual(0)[0] == Approx(1000.0));
        CHECK(sub.getCapacityDual(0)[0] <= -990.0 + 1.0e-6);
        CHECK(sub.getCapacityDual(0)[1] <= -950.0 + 1.0e-6);
    }

    SECTION("merit order dispatch") {
        double x[2] = {60.0, 100.0};
        REQUIRE(sub.solve(x) == GEP_RTN_OK);
        REQUIRE(sub.isOptimal());
        CHECK(sub.getObjective(0) == Approx(2600.0));
        CHECK(sub.getDispatch(0)[0] == Approx(60.0));
        CHECK(sub.getDispatch(0)[1] == Approx(40.0));
        CHECK(sub.getUnservedEnergy(0)[0] == Approx(0.0).margin(1.0e-9));
        CHECK(sub.getDemandDual(0)[0] == Approx(50.0));
        CHECK(sub.getCapacityDual(0)[0] == Approx(-40.0));
        CHECK(sub.getCapacityDual(0)[1] == Approx(0.0).margin(1.0e-9));
    }

    SECTION("cut is tight at the point of generation") {
        double points[3][2] = {{0.0, 0.0}, {60.0, 100.0}, {30.0, 20.0}};
        for (int k = 0; k < 3; ++k) {
            REQUIRE(sub.solve(points[k]) == GEP_RTN_OK);
            double intercept = 0.0;
            double gradient[2];
            REQUIRE(BdCutGen::generateScenarioCut(model, &sub, 0, intercept, gradient) == GEP_RTN_OK);
            CHECK(BdCutGen::evaluateCut(2, intercept, gradient, points[k]) == Approx(sub.getObjective(0)));
        }
    }

    delete model;
}

TEST_CASE("Dispatch subproblems of several scenarios") {
    GepParams par;
    GepMessage message(0);
    GepModel * model = createExpansionModel(true);
    REQUIRE(model->validate() == GEP_RTN_OK);

    BdSub sub(model, &par, &message);
    REQUIRE(sub.init() == GEP_RTN_OK);

    SECTION("feasible at zero investment") {
        double x[4] = {0.0, 0.0, 0.0, 0.0};
        REQUIRE(sub.solve(x) == GEP_RTN_OK);
        REQUIRE(sub.isOptimal());
        CHECK_FALSE(sub.isInfeasible());
        for (int s = 0; s < 2; ++s)
            for (int j = 0; j < 3; ++j)
                CHECK(sub.getUnservedEnergy(s)[j] == Approx(model->getWidth(s)[j]));
    }

    SECTION("expected objective") {
        double x[4] = {5000.0, 1000.0, 2000.0, 500.0};
        REQUIRE(sub.solve(x) == GEP_RTN_OK);
        REQUIRE(sub.isOptimal());
        CHECK(sub.getExpectedObjective() ==
                Approx(0.1 * sub.getObjective(0) + 0.9 * sub.getObjective(1)));
    }

    delete model;
}
