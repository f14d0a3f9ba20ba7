// tests-BdLog.cpp
#include <fstream>
#include <string>
#include "catch2/catch.hpp"

#include "Solver/Benders/BdLog.h"
#include "test_models.h"

static std::string joinColumns(const BdLog & log) {
    std::string joined;
    for (unsigned k = 0; k < log.getColumns().size(); ++k)
        joined += (k > 0 ? "," : "") + log.getColumns()[k];
    return joined;
}

TEST_CASE("Iteration log columns") {
    SECTION("deterministic") {
        GepModel * model = createTwoTechModel();
        REQUIRE(model->validate() == GEP_RTN_OK);
        BdLog log;
        REQUIRE(log.init(model, false) == GEP_RTN_OK);
        CHECK(joinColumns(log) == "iter,A,B,theta,investment_cost,Q,LB,UB,gap,cut_type");
        CHECK(log.init(model, false) == GEP_RTN_ERR);
        delete model;
    }

    SECTION("aggregate cuts") {
        GepModel * model = createExpansionModel(true);
        REQUIRE(model->validate() == GEP_RTN_OK);
        BdLog log;
        REQUIRE(log.init(model, false) == GEP_RTN_OK);
        CHECK(joinColumns(log) == "iter,coal,gas,nuclear,oil,theta,investment_cost,EQ,LB,UB,gap,cut_type");
        delete model;
    }

    SECTION("multiple cuts") {
        GepModel * model = createExpansionModel(true);
        REQUIRE(model->validate() == GEP_RTN_OK);
        BdLog log;
        REQUIRE(log.init(model, true) == GEP_RTN_OK);
        CHECK(joinColumns(log) ==
                "iter,coal,gas,nuclear,oil,theta_1,theta_2,investment_cost,EQ,Q_1,Q_2,LB,UB,gap,cut_type");
        delete model;
    }
}

TEST_CASE("Iteration log records") {
    GepModel * model = createTwoTechModel();
    REQUIRE(model->validate() == GEP_RTN_OK);

    BdLog log;

    BdIterRecord rec;
    rec.iter = 1;
    rec.x.assign(2, 0.0);
    rec.theta.assign(1, 0.0);
    rec.investment = 0.0;
    rec.recourse.assign(1, 100000.0);
    rec.lb = 0.0;
    rec.ub = 100000.0;
    rec.gap = 100000.0;
    rec.cutType = BD_TAG_OPTIMALITY;

    SECTION("not initialized") {
        CHECK(log.record(rec) == GEP_RTN_ERR);
    }

    REQUIRE(log.init(model, false) == GEP_RTN_OK);

    SECTION("shape mismatch") {
        rec.x.assign(3, 0.0);
        CHECK(log.record(rec) == GEP_RTN_ERR);
        CHECK(log.getNumRecords() == 0);
    }

    SECTION("clear") {
        REQUIRE(log.record(rec) == GEP_RTN_OK);
        log.setSummary(BdSummary());
        log.clear();
        CHECK(log.getColumns().empty());
        CHECK(log.getNumRecords() == 0);
        CHECK_FALSE(log.hasSummary());
        CHECK(log.record(rec) == GEP_RTN_ERR);

        GepModel * other = createExpansionModel(true);
        REQUIRE(other->validate() == GEP_RTN_OK);
        REQUIRE(log.init(other, true) == GEP_RTN_OK);
        CHECK(joinColumns(log) ==
                "iter,coal,gas,nuclear,oil,theta_1,theta_2,investment_cost,EQ,Q_1,Q_2,LB,UB,gap,cut_type");
        delete other;
    }

    SECTION("write files") {
        REQUIRE(log.record(rec) == GEP_RTN_OK);

        BdSummary summary;
        summary.x.assign(2, 0.0);
        summary.theta.assign(1, 100000.0);
        summary.eens.assign(1, 100.0);
        summary.lb = 100000.0;
        summary.ub = 100000.0;
        summary.status = GEP_STAT_OPTIMAL;
        summary.iterations = 1;
        log.setSummary(summary);

        REQUIRE(log.writeCsv("tests-BdLog") == GEP_RTN_OK);

        std::ifstream fp("tests-BdLog_iterations.csv");
        REQUIRE(fp.is_open());
        std::string line;
        std::getline(fp, line);
        CHECK(line == "iter,A,B,theta,investment_cost,Q,LB,UB,gap,cut_type");
        std::getline(fp, line);
        CHECK(line == "1,0,0,0,0,100000,0,100000,100000,optimality");
        fp.close();

        std::ifstream fs("tests-BdLog_summary.csv");
        REQUIRE(fs.is_open());
        std::getline(fs, line);
        CHECK(line == "name,value");
        std::getline(fs, line);
        CHECK(line == "outcome,converged");
        fs.close();
    }

    delete model;
}
