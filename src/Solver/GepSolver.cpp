/*
 * GepSolver.cpp
 *
 *  Created on: Oct 19, 2026
 */

#include "Solver/GepSolver.h"

GepSolver::GepSolver(
		GepModel *   model,  /**< model pointer */
		GepParams *  par,    /**< parameter pointer */
		GepMessage * message /**< message pointer */) :
model_(model),
par_(par),
message_(message),
status_(GEP_STAT_NOT_SOLVED),
bestprimobj_(COIN_DBL_MAX),
primobj_(COIN_DBL_MAX),
bestdualobj_(-COIN_DBL_MAX),
cputime_(0.0),
walltime_(0.0),
numIterations_(0),
tic_(0.0),
time_remains_(COIN_DBL_MAX),
iterlim_(COIN_INT_MAX)
{
	/** nothing to do */
}

GepSolver::~GepSolver()
{
	model_ = NULL;
	par_ = NULL;
	message_ = NULL;
}
