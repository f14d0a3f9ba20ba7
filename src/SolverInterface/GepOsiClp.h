/**
 * GepOsiClp.h
 *
 * 10/19/2026
 */

#ifndef SRC_SOLVERINTERFACE_GEPOSICLP_H_
#define SRC_SOLVERINTERFACE_GEPOSICLP_H_

#include "SolverInterface/GepOsi.h"
#include "OsiClpSolverInterface.hpp"

class GepOsiClp : public GepOsi {
public:

	/** default constructor */
	GepOsiClp() {
		si_ = new OsiClpSolverInterface();
		clp_ = dynamic_cast<OsiClpSolverInterface*>(si_);
	}

	/** destructor */
	virtual ~GepOsiClp() {
		clp_ = NULL;
	}

	/** solve problem from scratch */
	virtual void solve() {
		si_->initialSolve();
	}

	/** solution status */
	virtual int status() {
		int status = GEP_STAT_UNKNOWN;
		int status1 = clp_->getModelPtr()->status();

		if (status1 == -1) {
			status = GEP_STAT_ABORT;
		} else if (status1 == 0) {
			status = GEP_STAT_OPTIMAL;
		} else if (status1 == 1) {
			status = GEP_STAT_PRIM_INFEASIBLE;
		} else if (status1 == 2) {
			status = GEP_STAT_DUAL_INFEASIBLE;
		} else if (status1 == 3) {
			status = GEP_STAT_LIM_ITERorTIME;
		} else {
			status = GEP_STAT_ABORT;
		}
		return status;
	}

	/** set log level */
	virtual void setLogLevel(int level) {
		clp_->messageHandler()->setLogLevel(level);
		clp_->getModelPtr()->setLogLevel(level);
	}

	/** set time limit */
	virtual void setTimeLimit(double time) {
		clp_->getModelPtr()->setMaximumSeconds(time);
	}

	OsiClpSolverInterface* clp_;
};

#endif /* SRC_SOLVERINTERFACE_GEPOSICLP_H_ */
