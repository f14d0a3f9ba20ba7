/**
 * GepOsi.h
 *
 * 10/19/2026
 */

#ifndef SRC_SOLVERINTERFACE_GEPOSI_H_
#define SRC_SOLVERINTERFACE_GEPOSI_H_

#include "Utility/GepRtnCodes.h"
#include "OsiSolverInterface.hpp"

/**
 * A thin wrapper of an Osi solver interface.
 * The LP itself is loaded through si_.
 */
class GepOsi {
public:

	/** default constructor */
	GepOsi() : si_(NULL) {}

	/** destructor */
	virtual ~GepOsi() {
		delete si_;
		si_ = NULL;
	}

	/** solve problem */
	virtual void solve() = 0;

	/** solution status mapped to GEP_STAT_* */
	virtual int status() = 0;

	/** get primal objective value */
	virtual double getPrimObjValue() {return si_->getObjValue();}

	/** set log level */
	virtual void setLogLevel(int level) {
		si_->messageHandler()->setLogLevel(level);
	}

	/** set time limit */
	virtual void setTimeLimit(double time) {}

	OsiSolverInterface *si_;

private:

	GepOsi(const GepOsi& rhs);
	GepOsi& operator=(const GepOsi& rhs);
};

#endif /* SRC_SOLVERINTERFACE_GEPOSI_H_ */
