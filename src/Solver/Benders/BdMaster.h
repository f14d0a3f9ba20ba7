/*
 * BdMaster.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_SOLVER_BENDERS_BDMASTER_H_
#define SRC_SOLVER_BENDERS_BDMASTER_H_

#include <vector>
#include "Solver/GepSolver.h"
#include "Solver/Benders/BdCut.h"
#include "SolverInterface/GepOsi.h"

/**
 * A class for implementing the Benders master (investment) problem.
 *
 * Columns are x_0..x_{n-1} followed by one recourse column (aggregate)
 * or one recourse column per scenario (multi-cut), all nonnegative.
 * The problem is rebuilt from the stored cuts on every solve.
 */
class BdMaster: public GepSolver {

public:

	/** A default constructor. */
	BdMaster(
			GepModel *   model,  /**< model pointer */
			GepParams *  par,    /**< parameter pointer */
			GepMessage * message /**< message pointer */);

	/** A default destructor. */
	virtual ~BdMaster();

	/** A virtual member for initializing solver. */
	virtual GEP_RTN_CODE init();

	/** A virtual member for solving problem. */
	virtual GEP_RTN_CODE solve();

	/** A virtual memeber for finalizing solver. */
	virtual GEP_RTN_CODE finalize() {return GEP_RTN_OK;}

	/** add an optimality cut theta_k >= intercept + gradient * x */
	GEP_RTN_CODE addOptimalityCut(
			double         intercept, /**< cut intercept */
			const double * gradient,  /**< cut gradient */
			int            scenario = -1 /**< scenario index in multi-cut mode */);

	/** add the feasibility cut sum_i x_i >= max_j width[j,s] */
	GEP_RTN_CODE addFeasibilityCut(int scenario);

	/**@name Get functions */
	//@{

	/** is multi-cut mode? */
	bool isMultiCut() const {return multicut_;}

	/** number of investment columns */
	int getNumTechs() const {return ntechs_;}

	/** number of recourse columns */
	int getNumThetas() const {return nthetas_;}

	/** recourse column values */
	const double * getTheta() {return primsol_.empty() ? NULL : &primsol_[ntechs_];}

	/** number of stored cuts */
	int getNumCuts() const {return static_cast<int>(cuts_.size());}

	/** stored cut */
	const BdCut & getCut(int i) const {return cuts_[i];}

	//@}

protected:

	/** create a solver interface */
	virtual GepOsi * createGepOsi();

	/** create problem */
	virtual GEP_RTN_CODE createProblem();

protected:

	GepOsi * osi_; /**< solver interface */

	bool multicut_; /**< one recourse column per scenario */
	int ntechs_;    /**< number of investment columns */
	int nthetas_;   /**< number of recourse columns */

	std::vector<BdCut> cuts_; /**< cuts in the order added */
};

#endif /* SRC_SOLVER_BENDERS_BDMASTER_H_ */
