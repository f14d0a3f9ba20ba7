/*
 * GepCInterface.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef GEPCINTERFACE_H_
#define GEPCINTERFACE_H_

#include "GepApiEnv.h"

/** create API environment */
GepApiEnv * createEnv(void);

/** free API environment */
void freeEnv(GepApiEnv * &env);

/** free model */
void freeModel(GepApiEnv * env);

/** free solver */
void freeSolver(GepApiEnv * env);

/** get model pointer */
GepModel * getModelPtr(GepApiEnv * env);

/** read technology, needs and (optional) scenario tables */
int readCsv(
		GepApiEnv *  env,       /**< pointer to API object */
		const char * techfile,  /**< technology table */
		const char * needsfile, /**< demand slice table */
		const char * scenfile   /**< scenario table; NULL for deterministic */);

/** solve by Benders decomposition */
int solveBd(GepApiEnv * env /**< pointer to API object */);

/** read parameter file; returns the number of rejected lines */
int readParamFile(GepApiEnv * env, const char * param_file);

/** set parameters */
void setBoolParam(GepApiEnv * env, const char * name, bool value);
void setIntParam(GepApiEnv * env, const char * name, int value);
void setDblParam(GepApiEnv * env, const char * name, double value);
void setStrParam(GepApiEnv * env, const char * name, const char * value);

/** get solution information */
int getNumTechs(GepApiEnv * env);
int getNumScenarios(GepApiEnv * env);
double getCpuTime(GepApiEnv * env);
double getWallTime(GepApiEnv * env);
int getStatus(GepApiEnv * env);
double getPrimalBound(GepApiEnv * env);
double getDualBound(GepApiEnv * env);
void getPrimalSolution(GepApiEnv * env, int num, double * solution);
int getNumIterations(GepApiEnv * env);

#endif /* GEPCINTERFACE_H_ */
