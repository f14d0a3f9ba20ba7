/*
 * main.cpp
 *
 *  Created on: Oct 19, 2026
 */

#include <stdlib.h>
#include <string.h>
#include <getopt.h>
#include <iostream>
#include <vector>

/** GEP */
#include "GepCInterface.h"

using namespace std;

/** This is an executable GEP reading CSV tables.
 */

int main(int argc, char ** argv)
{
	if (argc == 1)
	{
		cout << "Usage: gep -t <technology.csv> -d <needs.csv> [options]\n"
				<< "  Options:\n"
				<< "    -s  scenario table (default: deterministic)\n"
				<< "    -p  parameter file\n"
				<< "    -c  multi-cut (one cut per scenario)\n"
				<< "    -I  iteration limit (default: 50)\n"
				<< "    -g  gap tolerance (default: 1e-3)\n"
				<< "    -v  value of lost load (default: 1000)\n"
				<< "    -n  number of threads for subproblems (default: 1)\n"
				<< "    -W  wallclock time limit\n"
				<< "    -l  print level (default: 1)\n"
				<< "    -L  prefix of output file names (default: gep)\n"
				<< endl;
		return 0;
	}

	string techfile;
	string needsfile;
	string scenfile;
	string paramfile;

	GepApiEnv * env = createEnv();

	/** options are applied after the parameter file */
	bool multicut = false;
	int iter_limit = -1;
	double gap_tol = -1.0;
	double voll = -1.0;
	int nthreads = -1;
	double wall_limit = -1.0;
	int loglevel = -1;
	string prefix;

	int c;
	while ((c = getopt(argc, argv, "t:d:s:p:cI:g:v:n:W:l:L:")) != -1)
	{
		switch (c)
		{
		case 't':
			techfile.assign(optarg);
			break;
		case 'd':
			needsfile.assign(optarg);
			break;
		case 's':
			scenfile.assign(optarg);
			break;
		case 'p':
			paramfile.assign(optarg);
			break;
		case 'c':
			multicut = true;
			break;
		case 'I':
			iter_limit = atoi(optarg);
			break;
		case 'g':
			gap_tol = atof(optarg);
			break;
		case 'v':
			voll = atof(optarg);
			break;
		case 'n':
			nthreads = atoi(optarg);
			break;
		case 'W':
			wall_limit = atof(optarg);
			break;
		case 'l':
			loglevel = atoi(optarg);
			break;
		case 'L':
			prefix.assign(optarg);
			break;
		case '?':
			break;
		default:
			break;
		}
	}

	if (techfile.empty() || needsfile.empty())
	{
		cout << "Error: both -t and -d are required." << endl;
		freeEnv(env);
		return 1;
	}

	if (!paramfile.empty() && readParamFile(env, paramfile.c_str()) != 0)
		cout << "Warning: some parameters in " << paramfile << " are not set." << endl;

	if (multicut) setBoolParam(env, "BD/MULTI_CUT", true);
	if (iter_limit >= 0) setIntParam(env, "BD/ITER_LIM", iter_limit);
	if (gap_tol >= 0.0) setDblParam(env, "BD/GAP_TOL", gap_tol);
	if (voll >= 0.0) setDblParam(env, "BD/VOLL", voll);
	if (nthreads > 0) setIntParam(env, "BD/SUB/THREADS", nthreads);
	if (wall_limit >= 0.0) setDblParam(env, "BD/WALL_LIM", wall_limit);
	if (loglevel >= 0) setIntParam(env, "LOG_LEVEL", loglevel);
	if (!prefix.empty()) setStrParam(env, "OUTPUT/PREFIX", prefix.c_str());

	if (env->par_->getIntParam("LOG_LEVEL") > 0)
		show_copyright();

	int rtn = readCsv(env, techfile.c_str(), needsfile.c_str(),
			scenfile.empty() ? NULL : scenfile.c_str());
	if (rtn == GEP_RTN_OK)
		rtn = solveBd(env);

	if (env->solver_)
	{
		int ntechs = getNumTechs(env);
		vector<double> x(ntechs, 0.0);
		getPrimalSolution(env, ntechs, &x[0]);

		cout << "Total solution time: " << getWallTime(env) << " seconds" << endl;
		cout << "Solution status: " << gepStatusName(getStatus(env)) << endl;
		cout << "Number of iterations: " << getNumIterations(env) << endl;
		cout << "Upper bound: " << getPrimalBound(env) << endl;
		cout << "Lower bound: " << getDualBound(env) << endl;
		for (int i = 0; i < ntechs; ++i)
			cout << "  " << env->model_->getTechName(i) << ": " << x[i] << endl;
	}

	/** free memory */
	freeEnv(env);

	return rtn == GEP_RTN_OK ? 0 : 1;
}
