// tests-GepParams.cpp
#include <fstream>
#include "catch2/catch.hpp"

#include "Utility/GepParams.h"

TEST_CASE("Parameter defaults and updates") {
    GepParams par;

    SECTION("default values") {
        CHECK(par.getBoolParam("BD/MULTI_CUT") == false);
        CHECK(par.getIntParam("BD/ITER_LIM") == 50);
        CHECK(par.getDblParam("BD/GAP_TOL") == Approx(1.0e-3));
        CHECK(par.getDblParam("BD/REL_GAP_TOL") == 0.0);
        CHECK(par.getDblParam("BD/VOLL") == Approx(1000.0));
        CHECK(par.getStrParam("OUTPUT/PREFIX") == "gep");
    }

    SECTION("set known parameters") {
        REQUIRE(par.setIntParam("BD/ITER_LIM", 7));
        REQUIRE(par.setBoolParam("BD/MULTI_CUT", true));
        CHECK(par.getIntParam("BD/ITER_LIM") == 7);
        CHECK(par.getBoolParam("BD/MULTI_CUT") == true);
    }

    SECTION("unknown parameters are rejected") {
        CHECK_FALSE(par.setIntParam("BD/NO_SUCH_PARAM", 1));
    }
}

TEST_CASE("Reading a parameter file") {
    GepParams par;

    SECTION("valid and invalid lines") {
        std::ofstream fp("tests-GepParams.txt");
        fp << "# comment line\n"
           << "int BD/ITER_LIM 12   # trailing comment\n"
           << "double BD/VOLL 2500\n"
           << "bool BD/MULTI_CUT true\n"
           << "string OUTPUT/PREFIX run1\n"
           << "\n"
           << "int BD/UNKNOWN 3\n"
           << "float BD/GAP_TOL 0.1\n";
        fp.close();

        int nrejected = par.readParamFile("tests-GepParams.txt");
        CHECK(nrejected == 2);
        CHECK(par.getIntParam("BD/ITER_LIM") == 12);
        CHECK(par.getDblParam("BD/VOLL") == Approx(2500.0));
        CHECK(par.getBoolParam("BD/MULTI_CUT") == true);
        CHECK(par.getStrParam("OUTPUT/PREFIX") == "run1");
        CHECK(par.getDblParam("BD/GAP_TOL") == Approx(1.0e-3));
    }

    SECTION("missing file") {
        CHECK(par.readParamFile("no-such-file.txt") == -1);
    }
}
