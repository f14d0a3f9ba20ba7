/*
 * GepRtnCodes.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef GEPRTNCODES_H_
#define GEPRTNCODES_H_

#include <stdio.h>
#include "CoinError.hpp"

/*
 * This defines return codes.
 */

typedef int GEP_RTN_CODE;

#define GEP_RTN_OK          0
#define GEP_RTN_ERR         1
#define GEP_RTN_DATA_ERR    2 /**< malformed or inconsistent input data */
#define GEP_RTN_MASTER_ERR  3 /**< master problem not solved to optimality */

#define GEP_STAT_OPTIMAL            3000
#define GEP_STAT_PRIM_INFEASIBLE    3001
#define GEP_STAT_DUAL_INFEASIBLE    3002
#define GEP_STAT_LIM_ITERorTIME     3004
#define GEP_STAT_STOPPED_TIME       3007
#define GEP_STAT_STOPPED_ITER       3010
#define GEP_STAT_STOPPED_UNKNOWN    3011
#define GEP_STAT_ABORT              3013
#define GEP_STAT_NOT_SOLVED         3998
#define GEP_STAT_UNKNOWN            3999

#define GEP_RTN_MSG_BODY "Error code %d in %s:%d"

#define GEP_RTN_CHECK_RTN_CODE(__Rtn)                             \
	{                                                             \
		GEP_RTN_CODE __rtn = __Rtn;                               \
		if (__rtn != GEP_RTN_OK) {                                \
			printf(GEP_RTN_MSG_BODY"\n", __rtn, __FILE__, __LINE__); \
			return __rtn;                                         \
		}                                                         \
	}

#define GEP_RTN_CHECK_THROW(__Rtn)                                       \
	{                                                                    \
		GEP_RTN_CODE __rtn = __Rtn;                                      \
		if (__rtn != GEP_RTN_OK) {                                       \
			char __tmpstr[128];                                          \
			sprintf(__tmpstr, GEP_RTN_MSG_BODY, __rtn, __FILE__, __LINE__); \
			throw CoinError(__tmpstr, "GEP_RTN_CHECK_THROW", "");        \
		}                                                                \
	}

/** outcome name of a decomposition status */
inline const char * gepStatusName(int status)
{
	switch (status)
	{
	case GEP_STAT_OPTIMAL:
		return "converged";
	case GEP_STAT_STOPPED_ITER:
		return "nonconvergence";
	case GEP_STAT_STOPPED_TIME:
		return "time_limit";
	case GEP_STAT_ABORT:
		return "master_infeasible";
	case GEP_STAT_STOPPED_UNKNOWN:
		return "subproblem_error";
	case GEP_STAT_NOT_SOLVED:
		return "not_solved";
	default:
		return "unknown";
	}
}

#endif /* GEPRTNCODES_H_ */
