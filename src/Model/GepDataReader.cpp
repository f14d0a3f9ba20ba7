/*
 * GepDataReader.cpp
 *
 *  Created on: Oct 19, 2026
 */

//#define GEP_DEBUG

#include <stdlib.h>
#include <fstream>
#include "Utility/GepMacros.h"
#include "Utility/GepMessage.h"
#include "Model/GepModel.h"
#include "Model/GepDataReader.h"

using namespace std;

GEP_RTN_CODE GepDataReader::read(
		GepModel *   model,
		const char * techfile,
		const char * needsfile,
		const char * scenfile)
{
	if (!model)
	{
		printf("Error: Null model pointer.\n");
		return GEP_RTN_ERR;
	}
	GEP_RTN_CHECK_RTN_CODE(readTechnologies(model, techfile));
	GEP_RTN_CHECK_RTN_CODE(readNeeds(model, needsfile));
	if (scenfile)
		GEP_RTN_CHECK_RTN_CODE(readScenarios(model, scenfile));

	return GEP_RTN_OK;
}

GEP_RTN_CODE GepDataReader::readTechnologies(GepModel * model, const char * filename)
{
	vector<vector<string> > rows;
	GEP_RTN_CHECK_RTN_CODE(readTable(filename, rows));

	int ntechs = static_cast<int>(rows.size());
	vector<string> names(ntechs);
	vector<double> cost(ntechs, 0.0);
	vector<double> invcost(ntechs, 0.0);

	for (int i = 0; i < ntechs; ++i)
	{
		if (rows[i].size() < 3)
		{
			printf("Error: %s: row %d has %d fields (expected 3).\n",
					filename, i + 2, static_cast<int>(rows[i].size()));
			return GEP_RTN_DATA_ERR;
		}
		names[i] = rows[i][0];
		if (!parseDouble(rows[i][1], cost[i]) || !parseDouble(rows[i][2], invcost[i]))
		{
			printf("Error: %s: row %d has a non-numeric cost.\n", filename, i + 2);
			return GEP_RTN_DATA_ERR;
		}
	}

	if (ntechs == 0)
	{
		printf("Error: %s: no technology is given.\n", filename);
		return GEP_RTN_DATA_ERR;
	}

	return model->loadTechnologies(ntechs, &names[0], &cost[0], &invcost[0]);
}

GEP_RTN_CODE GepDataReader::readNeeds(GepModel * model, const char * filename)
{
	vector<vector<string> > rows;
	GEP_RTN_CHECK_RTN_CODE(readTable(filename, rows));

	int nslices = static_cast<int>(rows.size());
	vector<double> duration(nslices, 0.0);
	vector<double> minlevel(nslices, 0.0);
	vector<double> maxlevel(nslices, 0.0);

	for (int j = 0; j < nslices; ++j)
	{
		if (rows[j].size() < 4)
		{
			printf("Error: %s: row %d has %d fields (expected 4).\n",
					filename, j + 2, static_cast<int>(rows[j].size()));
			return GEP_RTN_DATA_ERR;
		}
		/** the category column is informational */
		if (!parseDouble(rows[j][1], duration[j]) ||
			!parseDouble(rows[j][2], minlevel[j]) ||
			!parseDouble(rows[j][3], maxlevel[j]))
		{
			printf("Error: %s: row %d has a non-numeric field.\n", filename, j + 2);
			return GEP_RTN_DATA_ERR;
		}
	}

	if (nslices == 0)
	{
		printf("Error: %s: no demand slice is given.\n", filename);
		return GEP_RTN_DATA_ERR;
	}

	return model->loadSlices(nslices, &duration[0], &minlevel[0], &maxlevel[0]);
}

GEP_RTN_CODE GepDataReader::readScenarios(GepModel * model, const char * filename)
{
	vector<vector<string> > rows;
	GEP_RTN_CHECK_RTN_CODE(readTable(filename, rows));

	int nscen = static_cast<int>(rows.size());
	int nslices = model->getNumSlices();
	if (nscen == 0)
	{
		printf("Error: %s: no scenario is given.\n", filename);
		return GEP_RTN_DATA_ERR;
	}

	vector<double> prob(nscen, 0.0);
	vector<vector<double> > width(nscen, vector<double>(nslices, 0.0));
	vector<const double*> pwidth(nscen, NULL);

	for (int s = 0; s < nscen; ++s)
	{
		if (static_cast<int>(rows[s].size()) != nslices + 1)
		{
			printf("Error: %s: row %d has %d fields (expected %d).\n",
					filename, s + 2, static_cast<int>(rows[s].size()), nslices + 1);
			return GEP_RTN_DATA_ERR;
		}
		if (!parseDouble(rows[s][0], prob[s]))
		{
			printf("Error: %s: row %d has a non-numeric probability.\n", filename, s + 2);
			return GEP_RTN_DATA_ERR;
		}
		for (int j = 0; j < nslices; ++j)
		{
			if (!parseDouble(rows[s][j+1], width[s][j]))
			{
				printf("Error: %s: row %d has a non-numeric width.\n", filename, s + 2);
				return GEP_RTN_DATA_ERR;
			}
		}
		pwidth[s] = &width[s][0];
	}

	return model->loadScenarios(nscen, &prob[0], &pwidth[0]);
}

GEP_RTN_CODE GepDataReader::readTable(
		const char * filename,
		vector<vector<string> > & rows)
{
	rows.clear();
	if (!filename)
	{
		printf("Error: no file name is given.\n");
		return GEP_RTN_DATA_ERR;
	}

	ifstream myfile(filename);
	if (!myfile.is_open())
	{
		printf("Error: unable to open file %s.\n", filename);
		return GEP_RTN_DATA_ERR;
	}

	string line;
	bool is_header = true;
	size_t startpos, endpos, found;
	while (getline(myfile, line))
	{
		GEPdebugMessage("Read line: %s\n", line.c_str());

		/** UTF-8 byte order mark */
		if (is_header && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
			line = line.substr(3);

		/** empty line? */
		startpos = line.find_first_not_of(" \t\r");
		if (string::npos == startpos) continue;

		if (is_header)
		{
			is_header = false;
			continue;
		}

		vector<string> fields;
		while (true)
		{
			found = line.find_first_of(",");
			string field = line.substr(0, found);

			/** trim */
			startpos = field.find_first_not_of(" \t\r\"");
			endpos = field.find_last_not_of(" \t\r\"");
			if (string::npos == startpos)
				field.clear();
			else
				field = field.substr(startpos, endpos - startpos + 1);
			fields.push_back(field);

			if (string::npos == found) break;
			line = line.substr(found + 1);
		}
		rows.push_back(fields);
	}
	myfile.close();

	if (is_header)
	{
		printf("Error: file %s is empty.\n", filename);
		return GEP_RTN_DATA_ERR;
	}

	return GEP_RTN_OK;
}

bool GepDataReader::parseDouble(const string & field, double & value)
{
	if (field.empty()) return false;
	char * endptr = NULL;
	value = strtod(field.c_str(), &endptr);
	return endptr != field.c_str() && *endptr == '\0';
}
