/*
 * GepApiEnv.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef GEPAPIENV_H_
#define GEPAPIENV_H_

#include "GepConfig.h"
#include "Solver/Benders/BdDriver.h"
#include "Model/GepModel.h"
#include "Utility/GepParams.h"
#include "Utility/GepMessage.h"

/**
 * A class for GEP API environment.
 */
class GepApiEnv
{
public:
	/** A default constructore */
	GepApiEnv();

	/** A default destructore */
	virtual ~GepApiEnv();

	/** Query GEP version major */
	int getVersionMajor() { return GEP_VERSION_MAJOR; }

	/** Query GEP version minor */
	int getVersionMinor() { return GEP_VERSION_MINOR; }

	/** Query GEP version patch */
	int getVersionPatch() { return GEP_VERSION_PATCH; }

	BdDriver * solver_;    /**< A Benders driver object */
	GepModel * model_;     /**< A model object */
	GepParams * par_;      /**< A parameters object */
	GepMessage * message_; /**< A message object */
};

#endif /* GEPAPIENV_H_ */
