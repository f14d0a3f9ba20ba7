/*
 * BdDriver.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_SOLVER_BENDERS_BDDRIVER_H_
#define SRC_SOLVER_BENDERS_BDDRIVER_H_

#include "Solver/GepSolver.h"
#include "Solver/Benders/BdMaster.h"
#include "Solver/Benders/BdSub.h"
#include "Solver/Benders/BdLog.h"

/** driver states */
enum BdState {
	BD_STATE_INIT = 0,
	BD_STATE_SOLVING_MASTER,
	BD_STATE_SOLVING_SUBPROBLEMS,
	BD_STATE_CONVERGED,
	BD_STATE_ABORTED
};

/**
 * A driver class for Benders (L-shaped) decomposition of the expansion problem.
 *
 * Each iteration solves the master, evaluates every scenario at the master
 * solution and adds one aggregate cut or one cut per scenario. The driver
 * is the only writer of the bounds and the cut set.
 */
class BdDriver: public GepSolver {

public:

	/** A default constructor. */
	BdDriver(
			GepModel *   model,  /**< model pointer */
			GepParams *  par,    /**< parameters */
			GepMessage * message /**< message pointer */);

	/** A default destructor. */
	virtual ~BdDriver();

	/** A virtual member for initializing the driver. */
	virtual GEP_RTN_CODE init();

	/** A virtual member for running the driver. */
	virtual GEP_RTN_CODE run() {return solve();}
	virtual GEP_RTN_CODE solve();

	/** A virtual memeber for finalizing the driver. */
	virtual GEP_RTN_CODE finalize();

public:

	BdState getState() const {return state_;}
	const BdLog & getLog() const {return log_;}
	BdMaster * getMasterPtr() {return master_;}
	BdSub * getSubPtr() {return sub_;}

	/** recourse column values at termination */
	const double * getTheta() {return theta_.empty() ? NULL : &theta_[0];}

	/** lower bound (master objective) */
	double getLowerBound() {return bestdualobj_;}

	/** upper bound (best evaluated objective) */
	double getUpperBound() {return bestprimobj_;}

	/** upper bound minus lower bound */
	double getGap() {return gap_;}

protected:

	/** create the master problem */
	virtual BdMaster * createMaster();

	/** create the subproblems */
	virtual BdSub * createSub();

	/** is the gap closed? */
	bool isConverged() const;

	/** record the final summary */
	void summarize();

protected:

	BdMaster * master_; /**< master problem */
	BdSub * sub_;       /**< subproblems */
	BdLog log_;         /**< iteration log */

	BdState state_;  /**< current state */
	bool multicut_;  /**< one cut per scenario */
	double gap_;     /**< upper bound minus lower bound */

	std::vector<double> theta_; /**< recourse column values of the last master solution */
	bool evaluated_; /**< primsol_ has been evaluated by the subproblems */
};

#endif /* SRC_SOLVER_BENDERS_BDDRIVER_H_ */
