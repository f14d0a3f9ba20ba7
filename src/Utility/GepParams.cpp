/*
 * GepParams.cpp
 *
 *  Created on: Oct 19, 2026
 */

//#define GEP_DEBUG
#include <stdlib.h>
#include "Utility/GepMessage.h"
#include "Utility/GepParams.h"

#define MAX_DBL_NUM numeric_limits<double>::max()

GepParams::GepParams()
{
	initBoolParams();
	initIntParams();
	initDblParams();
	initStrParams();
}

GepParams::~GepParams()
{
	/** nothing to do */
}

/** read parameter file */
int GepParams::readParamFile(const char * param_file)
{
	int nrejected = 0;
	string line;
	ifstream myfile(param_file);
	if (myfile.is_open())
	{
		string param_element[3];
		size_t startpos, found;
		while(getline(myfile, line))
		{
			GEPdebugMessage("Read line: %s\n", line.c_str());
			/** comment out? */
			startpos = line.find_first_of("#");
			if(string::npos != startpos) line = line.substr(0, startpos);

			/** empty line? */
			startpos = line.find_first_not_of(" \t\r");
			if(string::npos == startpos) continue;

			bool is_valid = true;
			for (int i = 0; i < 3; ++i)
			{
				/** ltrim */
				startpos = line.find_first_not_of(" \t");
				if(string::npos != startpos) line = line.substr(startpos);

				/** read element */
				found = line.find_first_of(" \t\r");
				if(string::npos == found && i < 2)
				{
					printf("Invalid parameter format.\n");
					is_valid = false;
					break;
				}
				param_element[i] = line.substr(0, found);
				if (string::npos != found)
					line = line.substr(found);
			}
			if (!is_valid)
			{
				nrejected++;
				continue;
			}

			bool is_set = false;
			if (param_element[0].compare("bool") == 0)
			{
				if (param_element[2].compare("true") == 0)
					is_set = BoolParams_.setParam(param_element[1], true);
				else if (param_element[2].compare("false") == 0)
					is_set = BoolParams_.setParam(param_element[1], false);
				else
					printf("Invalid boolean value <%s>.\n", param_element[2].c_str());
			}
			else if (param_element[0].compare("double") == 0)
			{
				is_set = DblParams_.setParam(param_element[1], atof(param_element[2].c_str()));
			}
			else if (param_element[0].compare("int") == 0)
			{
				is_set = IntParams_.setParam(param_element[1], atoi(param_element[2].c_str()));
			}
			else if (param_element[0].compare("string") == 0)
			{
				is_set = StrParams_.setParam(param_element[1], param_element[2]);
			}
			else
			{
				printf("Invalid parameter type <%s>.\n", param_element[0].c_str());
			}
			if (!is_set) nrejected++;
		}
		myfile.close();
	}
	else
	{
		printf("Unable to open parameter file <%s>.\n", param_file);
		nrejected = -1;
	}
	return nrejected;
}

void GepParams::initBoolParams()
{
	/** one cut per scenario (multi-cut); otherwise a single aggregate cut */
	BoolParams_.createParam("BD/MULTI_CUT", false);

	/** write iteration log and summary files */
	BoolParams_.createParam("OUTPUT/WRITE", true);
}

void GepParams::initIntParams()
{
	/** print level */
	IntParams_.createParam("LOG_LEVEL", 1);

	/** iteration limit */
	IntParams_.createParam("BD/ITER_LIM", 50);

	/** number of threads used for subproblem solution (OpenMP) */
	IntParams_.createParam("BD/SUB/THREADS", 1);

	/** solver log levels */
	IntParams_.createParam("BD/MASTER/SOLVER/LOG_LEVEL", 0);
	IntParams_.createParam("BD/SUB/SOLVER/LOG_LEVEL", 0);
}

void GepParams::initDblParams()
{
	/** absolute gap tolerance */
	DblParams_.createParam("BD/GAP_TOL", 1.0e-3);

	/** relative gap tolerance; disabled when not positive */
	DblParams_.createParam("BD/REL_GAP_TOL", 0.0);

	/** value of lost load */
	DblParams_.createParam("BD/VOLL", 1000.0);

	/** wall clock limit */
	DblParams_.createParam("BD/WALL_LIM", MAX_DBL_NUM);

	/** time limit for each solver call */
	DblParams_.createParam("BD/MASTER/TIME_LIM", 1e+20);
	DblParams_.createParam("BD/SUB/TIME_LIM", 1e+20);

	/** tolerance on the sum of scenario probabilities */
	DblParams_.createParam("DATA/PROB_TOL", 1.0e-6);
}

void GepParams::initStrParams()
{
	/** prefix for output files */
	StrParams_.createParam("OUTPUT/PREFIX", "gep");
}
