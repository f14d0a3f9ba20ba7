/*
 * GepMessage.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef GEPMESSAGE_H_
#define GEPMESSAGE_H_

#include <stdarg.h>
#include <stdio.h>

class GepMessage
{
public:
	GepMessage(int logLevel): logLevel_(logLevel)
	{
		setbuf(stdout, NULL);
	}

	void print(int level, const char *fmt, ...)
	{
		if (level <= logLevel_)
		{
			va_list args;
			va_start(args, fmt);
			vfprintf(stdout, fmt, args);
			va_end(args);
		}
	}

	int logLevel_;
};

#ifdef GEP_DEBUG

#define GEPdebugMessage    printf("[%s:%d] debug: ", __FILE__, __LINE__), printf

#else/* GEP_DEBUG */

#define GEPdebugMessage    while (false) printf

#endif/* GEP_DEBUG */

#endif /* GEPMESSAGE_H_ */
