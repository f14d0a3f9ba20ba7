/*
 * BdSub.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_SOLVER_BENDERS_BDSUB_H_
#define SRC_SOLVER_BENDERS_BDSUB_H_

#include <vector>
#include "Utility/GepMacros.h"
#include "Utility/GepRtnCodes.h"
#include "Utility/GepParams.h"
#include "Utility/GepMessage.h"
#include "SolverInterface/GepOsi.h"
#include "Model/GepModel.h"

/**
 * This class evaluates the dispatch (recourse) problem of every scenario
 * at a fixed investment vector.
 *
 * For scenario s the dispatch LP has columns p[i,j] (index i*m+j) and
 * lol[j] (index n*m+j), demand rows j = 0..m-1 and capacity rows m+i.
 */
class BdSub {
public:

	/** A default constructor. */
	BdSub(
			GepModel *   model,  /**< model pointer */
			GepParams *  par,    /**< parameters */
			GepMessage * message /**< message pointer */);

	/** A default destructor. */
	virtual ~BdSub();

	/** allocate scenario storage and check the penalty price */
	GEP_RTN_CODE init();

	/** build and solve the dispatch problems of all scenarios at x */
	GEP_RTN_CODE solve(const double * x);

public:

	/** get number of scenarios */
	int getNumScenarios() const {return nscen_;}

	/** get objective value of scenario s */
	double getObjective(int s) const {return objvals_[s];}

	/** get solution status of scenario s */
	int getStatus(int s) const {return status_[s];}

	/** get demand balance duals of scenario s */
	const double * getDemandDual(int s) const {return &lambda_[s][0];}

	/** get capacity duals of scenario s */
	const double * getCapacityDual(int s) const {return &rho_[s][0];}

	/** get dispatch p[i*m+j] of scenario s */
	const double * getDispatch(int s) const {return &dispatch_[s][0];}

	/** get unserved energy by slice of scenario s */
	const double * getUnservedEnergy(int s) const {return &lol_[s][0];}

	/** are all scenarios solved to optimality? */
	bool isOptimal() const;

	/** does any scenario report infeasibility? */
	bool isInfeasible() const;

	/** expected objective value */
	double getExpectedObjective() const;

protected:

	/** create a solver interface */
	virtual GepOsi * createGepOsi();

private:

	/** build and solve one scenario; the body of the loop in solve */
	static void solveOneScenario(
			BdSub *        sub,
			int            s, /**< scenario index */
			const double * x  /**< investment vector */);

protected:

	GepModel * model_;     /**< model */
	GepParams * par_;      /**< parameters */
	GepMessage * message_; /**< message */

	int nscen_;   /**< number of scenarios */
	double voll_; /**< value of lost load */

	std::vector<GepOsi*> osi_;                   /**< solver interface per scenario */
	std::vector<double> objvals_;                /**< objective values */
	std::vector<int> status_;                    /**< solution status */
	std::vector<std::vector<double> > lambda_;   /**< demand balance duals */
	std::vector<std::vector<double> > rho_;      /**< capacity duals */
	std::vector<std::vector<double> > dispatch_; /**< dispatch */
	std::vector<std::vector<double> > lol_;      /**< unserved energy */

private:

	BdSub(const BdSub& rhs);
	BdSub& operator=(const BdSub& rhs);
};

#endif /* SRC_SOLVER_BENDERS_BDSUB_H_ */
