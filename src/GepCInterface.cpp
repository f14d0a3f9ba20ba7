/*
 * GepCInterface.cpp
 *
 *  Created on: Oct 19, 2026
 */

// #define GEP_DEBUG

#include "CoinHelperFunctions.hpp"
#include "Utility/GepMacros.h"
#include "Model/GepDataReader.h"
#include "GepCInterface.h"

GepApiEnv * createEnv(void)
{
	return new GepApiEnv;
}

void freeEnv(GepApiEnv * &env)
{
	FREE_PTR(env);
}

void freeModel(GepApiEnv * env)
{
	if (env == NULL) return;
	freeSolver(env);
	FREE_PTR(env->model_);
}

void freeSolver(GepApiEnv * env)
{
	if (env == NULL) return;
	FREE_PTR(env->solver_);
}

GepModel * getModelPtr(GepApiEnv * env)
{
	GEP_API_CHECK_ENV(NULL);
	if (env->model_ == NULL)
		env->model_ = new GepModel;
	return env->model_;
}

int readCsv(
		GepApiEnv *  env,
		const char * techfile,
		const char * needsfile,
		const char * scenfile)
{
	GEP_API_CHECK_ENV(GEP_RTN_ERR);
	freeModel(env);
	return GepDataReader::read(getModelPtr(env), techfile, needsfile, scenfile);
}

int solveBd(GepApiEnv * env)
{
	GEP_API_CHECK_MODEL(GEP_RTN_ERR);
	freeSolver(env);

	env->message_->logLevel_ = env->par_->getIntParam("LOG_LEVEL");
	env->solver_ = new BdDriver(env->model_, env->par_, env->message_);
	GEPdebugMessage("Created a Benders driver\n");

	GEP_RTN_CHECK_RTN_CODE(env->solver_->init());

	/** the log is written also when the run aborts */
	int rtn = env->solver_->run();
	GEP_RTN_CHECK_RTN_CODE(env->solver_->finalize());

	return rtn;
}

int readParamFile(GepApiEnv * env, const char * param_file)
{
	GEP_API_CHECK_ENV(-1);
	int nrejected = env->par_->readParamFile(param_file);
	env->message_->logLevel_ = env->par_->getIntParam("LOG_LEVEL");
	return nrejected;
}

void setBoolParam(GepApiEnv * env, const char * name, bool value)
{
	GEP_API_CHECK_ENV(;);
	env->par_->setBoolParam(name, value);
}

void setIntParam(GepApiEnv * env, const char * name, int value)
{
	GEP_API_CHECK_ENV(;);
	env->par_->setIntParam(name, value);
}

void setDblParam(GepApiEnv * env, const char * name, double value)
{
	GEP_API_CHECK_ENV(;);
	env->par_->setDblParam(name, value);
}

void setStrParam(GepApiEnv * env, const char * name, const char * value)
{
	GEP_API_CHECK_ENV(;);
	env->par_->setStrParam(name, value);
}

int getNumTechs(GepApiEnv * env)
{
	GEP_API_CHECK_MODEL(0);
	return env->model_->getNumTechs();
}

int getNumScenarios(GepApiEnv * env)
{
	GEP_API_CHECK_MODEL(0);
	return env->model_->getNumScenarios();
}

double getCpuTime(GepApiEnv * env)
{
	GEP_API_CHECK_SOLVER(0.0);
	return env->solver_->getCpuTime();
}

double getWallTime(GepApiEnv * env)
{
	GEP_API_CHECK_SOLVER(0.0);
	return env->solver_->getWallTime();
}

int getStatus(GepApiEnv * env)
{
	GEP_API_CHECK_SOLVER(GEP_STAT_NOT_SOLVED);
	return env->solver_->getStatus();
}

double getPrimalBound(GepApiEnv * env)
{
	GEP_API_CHECK_SOLVER(COIN_DBL_MAX);
	return env->solver_->getUpperBound();
}

double getDualBound(GepApiEnv * env)
{
	GEP_API_CHECK_SOLVER(-COIN_DBL_MAX);
	return env->solver_->getLowerBound();
}

void getPrimalSolution(GepApiEnv * env, int num, double * solution)
{
	GEP_API_CHECK_SOLVER(;);
	const double * x = env->solver_->getPrimalSolution();
	if (x == NULL) return;
	CoinCopyN(x, CoinMin(num, env->model_->getNumTechs()), solution);
}

int getNumIterations(GepApiEnv * env)
{
	GEP_API_CHECK_SOLVER(0);
	return env->solver_->getNumIterations();
}
