/*
 * BdCutGen.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_SOLVER_BENDERS_BDCUTGEN_H_
#define SRC_SOLVER_BENDERS_BDCUTGEN_H_

#include "Utility/GepRtnCodes.h"
#include "Model/GepModel.h"
#include "Solver/Benders/BdSub.h"

/**
 * Builds Benders cuts from the dispatch duals.
 *
 * For scenario s the cut theta_s >= sum_j lambda_j * width_j + sum_i rho_i * x_i
 * supports the recourse function at the point where the duals were computed.
 */
class BdCutGen {
public:

	/** cut coefficients of a single dual solution */
	static void calculateCutElements(
			int            nslices,   /**< [in] number of slices */
			int            ntechs,    /**< [in] number of technologies */
			const double * width,     /**< [in] slice widths */
			const double * lambda,    /**< [in] demand balance duals */
			const double * rho,       /**< [in] capacity duals */
			double &       intercept, /**< [out] cut intercept */
			double *       gradient   /**< [out] cut gradient */);

	/** cut for scenario s (multi-cut) */
	static GEP_RTN_CODE generateScenarioCut(
			const GepModel * model,
			const BdSub *    sub,
			int              s,
			double &         intercept,
			double *         gradient);

	/** probability-weighted cut over all scenarios (aggregate) */
	static GEP_RTN_CODE generateAggregateCut(
			const GepModel * model,
			const BdSub *    sub,
			double &         intercept,
			double *         gradient);

	/** right-hand side of the feasibility cut sum_i x_i >= max_j width_j */
	static double feasibilityCutRhs(const GepModel * model, int s) {
		return model->getMaxWidth(s);
	}

	/** evaluate intercept + gradient * x */
	static double evaluateCut(int ntechs, double intercept, const double * gradient, const double * x);
};

#endif /* SRC_SOLVER_BENDERS_BDCUTGEN_H_ */
