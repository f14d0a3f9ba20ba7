/*
 * GepMacros.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef GEPMACROS_H_
#define GEPMACROS_H_

#include <iostream>
#include "CoinError.hpp"

/*
 * try-catch macros
 */

#define BGN_TRY_CATCH try { \
	CoinError::printErrors_ = true;

#define END_TRY_CATCH(STMT)                                                                \
	} catch (std::bad_alloc& ba) {                                                         \
		std::cerr << "bad_alloc caught: " << ba.what() << std::endl;                       \
		STMT                                                                               \
	} catch (CoinError& ce) {                                                              \
		std::cerr << "CoinError in " << ce.className() << "::" << ce.methodName()          \
				<< ": " << ce.message() << std::endl;                                      \
		STMT                                                                               \
	} catch (const char * str) {                                                           \
		std::cerr << str << std::endl;                                                     \
		STMT                                                                               \
	} catch (std::exception & e) {                                                         \
		std::cerr << "Exception: " << e.what() << std::endl;                               \
		STMT                                                                               \
	} catch (...) {                                                                        \
		std::cerr << "Exception occurred at " << __FILE__ << ":" << __LINE__ << std::endl; \
		STMT                                                                               \
	}

#define END_TRY_CATCH_RTN(STMT,RTN_VAL)  \
	END_TRY_CATCH(STMT; return RTN_VAL;)


/*
 * Memory related macros
 */

#define FREE_PTR(PTR) \
	if (PTR) {        \
		delete PTR;   \
		PTR = NULL;   \
	}

/**
 * API environment checks
 */

#define GEP_API_CHECK_ENV(RTN)                \
	if (env == NULL) {                        \
		printf("Error: Null API pointer.\n"); \
		return RTN;                           \
	}
#define GEP_API_CHECK_MODEL(RTN)                \
	GEP_API_CHECK_ENV(RTN)                      \
	if (env->model_ == NULL) {                  \
		printf("Error: Null model pointer.\n"); \
		return RTN;                             \
	}
#define GEP_API_CHECK_SOLVER(RTN)                \
	GEP_API_CHECK_ENV(RTN)                       \
	if (env->solver_ == NULL) {                  \
		printf("Error: Null solver pointer.\n"); \
		return RTN;                              \
	}

#endif /* GEPMACROS_H_ */
