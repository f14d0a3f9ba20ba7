/*
 * GepSolver.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef GEPSOLVER_H_
#define GEPSOLVER_H_

#include <cmath>
#include <vector>
#include "CoinFinite.hpp"
#include "CoinTime.hpp"
#include "Utility/GepMessage.h"
#include "Utility/GepRtnCodes.h"
#include "Utility/GepParams.h"
#include "Model/GepModel.h"

/**
 * Abstract class for a solver of the expansion problem.
 */
class GepSolver {
public:

	/** A default constructor. */
	GepSolver(
			GepModel *   model,  /**< model pointer */
			GepParams *  par,    /**< parameter pointer */
			GepMessage * message /**< message pointer */);

	/** A default destructor */
	virtual ~GepSolver();

	/** A pure virtual member for initializing solver. */
	virtual GEP_RTN_CODE init() = 0;

	/** A pure virtual member for solving problem. */
	virtual GEP_RTN_CODE solve() = 0;

	/** A pure virtual memeber for finalizing solver. */
	virtual GEP_RTN_CODE finalize() = 0;

	/**@name Get functions */
	//@{

	/** A virtual member to get primal solution */
	virtual const double * getPrimalSolution() {return primsol_.empty() ? NULL : &primsol_[0];}

	/** A virtual member to get best primal objective */
	virtual double getBestPrimalObjective() {return bestprimobj_;}

	/** A virtual member to get primal objective */
	virtual double getPrimalObjective() {return primobj_;}

	/** A virtual member to get best dual objective */
	virtual double getBestDualObjective() {return bestdualobj_;}

	/** A virtual member to return relative duality gap */
	virtual double getRelDualityGap() {return fabs(bestprimobj_-bestdualobj_) / (1.0e-10 + fabs(bestprimobj_));}

	/** A virtual member to get solution time */
	virtual double getCpuTime() {return cputime_;}
	virtual double getWallTime() {return walltime_;}

	/** A virtual member to get number of iterations */
	virtual int getNumIterations() {return numIterations_;}

	/** get status */
	virtual int getStatus() {return status_;}

	//@}

protected:

	/** update time stamp */
	virtual void tic() {
		tic_ = CoinGetTimeOfDay();
	}

	/** update time stamp and time remains */
	virtual void ticToc() {
		time_remains_ -= CoinGetTimeOfDay() - tic_;
		tic_ = CoinGetTimeOfDay();
	}

protected:

	GepModel * model_;     /**< model */
	GepParams * par_;      /**< parameters */
	GepMessage * message_; /**< message */

	int status_; /**< solution status */

	std::vector<double> primsol_; /**< current primal solution */
	double bestprimobj_; /**< best primal objective value */
	double primobj_;     /**< current primal objective value */
	double bestdualobj_; /**< best dual objective value */

	double cputime_;  /**< cpu time */
	double walltime_; /**< wall time */
	int numIterations_; /**< number of iterations */

	double tic_;          /**< time stamp */
	double time_remains_; /**< remaining wall time */
	int iterlim_;         /**< iteration limit */
};

#endif /* GEPSOLVER_H_ */
