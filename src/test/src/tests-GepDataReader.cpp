// tests-GepDataReader.cpp
#include <fstream>
#include "catch2/catch.hpp"

#include "Model/GepModel.h"
#include "Model/GepDataReader.h"

static void writeFile(const char * filename, const char * content) {
    std::ofstream fp(filename);
    fp << content;
    fp.close();
}

TEST_CASE("Reading CSV tables") {
    writeFile("tests-technology.csv",
            "\xEF\xBB\xBFtechnology,cost,initial_investment\r\n"
            "coal,25,16\r\n"
            "gas, 80 ,5\r\n"
            "nuclear,6.5,46\r\n"
            "oil,160,2\r\n");
    writeFile("tests-needs.csv",
            "category,duration,min_level,max_level\n"
            "base,1.0,0,7086\n"
            "medium,0.79908675799,7086,9004\n"
            "peak,0.17123287671,9004,11169\n"
            "\n");
    writeFile("tests-scenarios.csv",
            "probability,base,medium,peak\n"
            "0.1,7086,1918,2165\n"
            "0.9,3919,3410,2986\n");

    GepModel model;

    SECTION("deterministic tables") {
        REQUIRE(GepDataReader::read(&model, "tests-technology.csv", "tests-needs.csv") == GEP_RTN_OK);
        REQUIRE(model.validate() == GEP_RTN_OK);
        CHECK(model.getNumTechs() == 4);
        CHECK(model.getTechName(0) == "coal");
        CHECK(model.getMarginalCost()[1] == Approx(80.0));
        CHECK(model.getInvestmentCost()[2] == Approx(46.0));
        CHECK(model.getNumSlices() == 3);
        CHECK(model.getDuration()[1] == Approx(0.79908675799));
        CHECK(model.getWidth(0)[1] == Approx(1918.0));
        CHECK_FALSE(model.isStochastic());
    }

    SECTION("stochastic tables") {
        REQUIRE(GepDataReader::read(&model, "tests-technology.csv", "tests-needs.csv",
                "tests-scenarios.csv") == GEP_RTN_OK);
        REQUIRE(model.validate() == GEP_RTN_OK);
        CHECK(model.isStochastic());
        CHECK(model.getNumScenarios() == 2);
        CHECK(model.getProbability()[1] == Approx(0.9));
        CHECK(model.getWidth(1)[0] == Approx(3919.0));
    }

    SECTION("missing file") {
        CHECK(GepDataReader::read(&model, "no-such-file.csv", "tests-needs.csv") == GEP_RTN_DATA_ERR);
    }

    SECTION("short row") {
        writeFile("tests-bad.csv",
                "technology,cost,initial_investment\n"
                "coal,25\n");
        CHECK(GepDataReader::readTechnologies(&model, "tests-bad.csv") == GEP_RTN_DATA_ERR);
    }

    SECTION("non-numeric field") {
        writeFile("tests-bad.csv",
                "category,duration,min_level,max_level\n"
                "base,one,0,7086\n");
        CHECK(GepDataReader::readNeeds(&model, "tests-bad.csv") == GEP_RTN_DATA_ERR);
    }

    SECTION("scenario row width mismatch") {
        writeFile("tests-bad.csv",
                "probability,base,medium,peak\n"
                "1.0,7086,1918\n");
        REQUIRE(GepDataReader::readNeeds(&model, "tests-needs.csv") == GEP_RTN_OK);
        CHECK(GepDataReader::readScenarios(&model, "tests-bad.csv") == GEP_RTN_DATA_ERR);
    }

    SECTION("header only") {
        writeFile("tests-bad.csv", "technology,cost,initial_investment\n");
        CHECK(GepDataReader::readTechnologies(&model, "tests-bad.csv") == GEP_RTN_DATA_ERR);
    }
}

TEST_CASE("Parsing numbers") {
    double value = 0.0;
    CHECK(GepDataReader::parseDouble("1.5e3", value));
    CHECK(value == Approx(1500.0));
    CHECK_FALSE(GepDataReader::parseDouble("", value));
    CHECK_FALSE(GepDataReader::parseDouble("12abc", value));
}
