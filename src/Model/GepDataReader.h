/*
 * GepDataReader.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_MODEL_GEPDATAREADER_H_
#define SRC_MODEL_GEPDATAREADER_H_

#include <string>
#include <vector>
#include "Utility/GepRtnCodes.h"

class GepModel;

/**
 * Reads the comma-separated input tables into a GepModel.
 * Every table has one header line; columns are taken by position.
 */
class GepDataReader {
public:

	/** read technologies, demand slices and (optional) scenarios */
	static GEP_RTN_CODE read(
			GepModel *   model,     /**< model to load */
			const char * techfile,  /**< technology,cost,initial_investment */
			const char * needsfile, /**< category,duration,min_level,max_level */
			const char * scenfile = NULL /**< probability,<width per slice> */);

	static GEP_RTN_CODE readTechnologies(GepModel * model, const char * filename);
	static GEP_RTN_CODE readNeeds(GepModel * model, const char * filename);
	static GEP_RTN_CODE readScenarios(GepModel * model, const char * filename);

	/** split a file into trimmed fields, dropping the header and empty lines */
	static GEP_RTN_CODE readTable(
			const char * filename,
			std::vector<std::vector<std::string> > & rows);

	/** parse a whole field as a double */
	static bool parseDouble(const std::string & field, double & value);
};

#endif /* SRC_MODEL_GEPDATAREADER_H_ */
