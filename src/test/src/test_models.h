// test_models.h
#ifndef TEST_MODELS_H_
#define TEST_MODELS_H_

#include <string>
#include "Model/GepModel.h"

/** two technologies, one slice of the given duration and width */
inline GepModel * createTwoTechModel(
        double duration = 1.0,
        double width = 100.0,
        double invA = 100000.0,
        double invB = 20000.0) {
    std::string names[2] = {"A", "B"};
    double cost[2] = {10.0, 50.0};
    double invcost[2] = {invA, invB};
    double minlevel[1] = {0.0};
    double maxlevel[1] = {width};

    GepModel * model = new GepModel;
    model->loadTechnologies(2, names, cost, invcost);
    model->loadSlices(1, &duration, minlevel, maxlevel);
    return model;
}

/** four technologies, three slices; stochastic with two scenarios or deterministic */
inline GepModel * createExpansionModel(bool stochastic) {
    std::string names[4] = {"coal", "gas", "nuclear", "oil"};
    double cost[4] = {25.0, 80.0, 6.5, 160.0};
    double invcost[4] = {16.0, 5.0, 46.0, 2.0};
    double duration[3] = {1.0, 0.79908675799, 0.17123287671};
    double minlevel[3] = {0.0, 7086.0, 9004.0};
    double maxlevel[3] = {7086.0, 9004.0, 11169.0};
    double prob[2] = {0.1, 0.9};
    double width1[3] = {7086.0, 1918.0, 2165.0};
    double width2[3] = {3919.0, 3410.0, 2986.0};
    const double * width[2] = {width1, width2};

    GepModel * model = new GepModel;
    model->loadTechnologies(4, names, cost, invcost);
    model->loadSlices(3, duration, minlevel, maxlevel);
    if (stochastic)
        model->loadScenarios(2, prob, width);
    return model;
}

/** optimal objective values of createExpansionModel */
const double EXPANSION_DET_OBJ = 400012.7442917925;
const double EXPANSION_STO_OBJ = 350113.0216890632;

#endif
