#include <stdio.h>
#include <string>
#include "GepCInterface.h"

/*
Two-scenario expansion example.

Four technologies (marginal cost, investment cost):
    coal     25.0   16
    gas      80.0    5
    nuclear   6.5   46
    oil     160.0    2

Three demand slices with durations 1.0, 0.79908675799, 0.17123287671 and widths
    scenario 1 (p = 0.1): 7086 1918 2165
    scenario 2 (p = 0.9): 3919 3410 2986

The value of lost load is 1000.
*/

int main(int argc, char **argv)
{
    GepApiEnv * env = createEnv();
    if (env == NULL) {
        printf("Failed to create GEP environment.\n");
        return 1;
    }

    // Problem Data
    int ntechs = 4;
    int nslices = 3;
    int nscen = 2;
    std::string names[] = {"coal", "gas", "nuclear", "oil"};
    double cost[] = {25.0, 80.0, 6.5, 160.0};
    double invcost[] = {16.0, 5.0, 46.0, 2.0};
    double duration[] = {1.0, 0.79908675799, 0.17123287671};
    double prob[] = {0.1, 0.9};
    double width1[] = {7086, 1918, 2165};
    double width2[] = {3919, 3410, 2986};
    const double * width[] = {width1, width2};

    GepModel * model = getModelPtr(env);
    model->loadTechnologies(ntechs, names, cost, invcost);
    model->loadDurations(nslices, duration);
    model->loadScenarios(nscen, prob, width);

    // multi-cut if any argument is given
    setBoolParam(env, "BD/MULTI_CUT", argc > 1);
    setBoolParam(env, "OUTPUT/WRITE", false);

    int rtn = solveBd(env);
    if (rtn != GEP_RTN_OK) {
        printf("Failed to solve the problem (%d).\n", rtn);
        freeEnv(env);
        return 1;
    }

    double x[4];
    getPrimalSolution(env, ntechs, x);
    printf("Status: %s\n", gepStatusName(getStatus(env)));
    printf("Objective value: %f\n", getPrimalBound(env));
    for (int i = 0; i < ntechs; ++i)
        printf("  %-8s %f\n", names[i].c_str(), x[i]);

    freeEnv(env);

    return 0;
}
