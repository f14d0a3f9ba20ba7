/*
 * GepApiEnv.cpp
 *
 *  Created on: Oct 19, 2026
 */

#include "GepApiEnv.h"
#include "Utility/GepMacros.h"

GepApiEnv::GepApiEnv() :
solver_(NULL), model_(NULL) {
	par_ = new GepParams;
	message_ = new GepMessage(par_->getIntParam("LOG_LEVEL"));
}

GepApiEnv::~GepApiEnv() {
	FREE_PTR(solver_);
	FREE_PTR(model_);
	FREE_PTR(par_);
	FREE_PTR(message_);
}
