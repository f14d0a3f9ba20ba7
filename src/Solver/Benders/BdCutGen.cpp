/*
 * BdCutGen.cpp
 *
 *  Created on: Oct 19, 2026
 */

// #define GEP_DEBUG

#include <vector>
#include "CoinHelperFunctions.hpp"
#include "Utility/GepMessage.h"
#include "Solver/Benders/BdCutGen.h"

void BdCutGen::calculateCutElements(
		int            nslices,   /**< [in] number of slices */
		int            ntechs,    /**< [in] number of technologies */
		const double * width,     /**< [in] slice widths */
		const double * lambda,    /**< [in] demand balance duals */
		const double * rho,       /**< [in] capacity duals */
		double &       intercept, /**< [out] cut intercept */
		double *       gradient   /**< [out] cut gradient */)
{
	intercept = 0.0;
	for (int j = 0; j < nslices; ++j)
		intercept += lambda[j] * width[j];
	CoinCopyN(rho, ntechs, gradient);
}

GEP_RTN_CODE BdCutGen::generateScenarioCut(
		const GepModel * model,
		const BdSub *    sub,
		int              s,
		double &         intercept,
		double *         gradient)
{
	if (s < 0 || s >= sub->getNumScenarios())
	{
		printf("Error: invalid scenario index %d.\n", s);
		return GEP_RTN_ERR;
	}
	if (sub->getStatus(s) != GEP_STAT_OPTIMAL)
	{
		printf("Error: scenario %d is not solved to optimality.\n", s);
		return GEP_RTN_ERR;
	}

	calculateCutElements(model->getNumSlices(), model->getNumTechs(), model->getWidth(s),
			sub->getDemandDual(s), sub->getCapacityDual(s), intercept, gradient);
	GEPdebugMessage("Scenario %d cut intercept %e\n", s, intercept);

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdCutGen::generateAggregateCut(
		const GepModel * model,
		const BdSub *    sub,
		double &         intercept,
		double *         gradient)
{
	int ntechs = model->getNumTechs();
	const double * prob = model->getProbability();

	double scen_intercept = 0.0;
	std::vector<double> scen_gradient(ntechs, 0.0);

	intercept = 0.0;
	CoinZeroN(gradient, ntechs);

	for (int s = 0; s < sub->getNumScenarios(); ++s)
	{
		GEP_RTN_CHECK_RTN_CODE(generateScenarioCut(model, sub, s, scen_intercept, &scen_gradient[0]));
		intercept += prob[s] * scen_intercept;
		for (int i = 0; i < ntechs; ++i)
			gradient[i] += prob[s] * scen_gradient[i];
	}

	return GEP_RTN_OK;
}

double BdCutGen::evaluateCut(int ntechs, double intercept, const double * gradient, const double * x)
{
	double val = intercept;
	for (int i = 0; i < ntechs; ++i)
		val += gradient[i] * x[i];
	return val;
}
