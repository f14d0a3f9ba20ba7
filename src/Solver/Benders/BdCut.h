/*
 * BdCut.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_SOLVER_BENDERS_BDCUT_H_
#define SRC_SOLVER_BENDERS_BDCUT_H_

#include <vector>

/** cut types */
#define BD_CUT_OPTIMALITY  0
#define BD_CUT_FEASIBILITY 1

/**
 * A Benders cut in the investment space.
 *
 * optimality:  theta_k - gradient * x >= intercept
 * feasibility: sum_i x_i >= intercept (gradient is all ones)
 *
 * scenario is the index of the recourse column in multi-cut mode, -1 otherwise.
 */
struct BdCut {
	int type;
	int scenario;
	double intercept;
	std::vector<double> gradient;

	BdCut() : type(BD_CUT_OPTIMALITY), scenario(-1), intercept(0.0) {}
};

#endif /* SRC_SOLVER_BENDERS_BDCUT_H_ */
