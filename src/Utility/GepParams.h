/*
 * GepParams.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_UTILITY_GEPPARAMS_H_
#define SRC_UTILITY_GEPPARAMS_H_

#include <stdio.h>
#include <limits>
#include <unordered_map>
#include <string>
#include <iostream>
#include <fstream>

using namespace std;

/**
 * This class create, set and get parameters.
 */
template <class T>
class GepParam {
public:

	/** create parameter */
	void createParam(string name, T const & value);

	/** set parameter */
	bool setParam(string name, T const & value);

	/** get parameter */
	T getParam(string name) const;

private:
	unordered_map<string,T> params_;
};

/** create parameter */
template<class T>
void GepParam<T>::createParam(string name, T const & value)
{
	if (params_.find(name) != params_.end())
		printf("WARNING: The parameter <%s> already exists.\n", name.c_str());
	else
		params_[name] = value;
}

/** set parameter */
template<class T>
bool GepParam<T>::setParam(string name, T const & value)
{
	auto found = params_.find(name);
	if (found != params_.end())
	{
		found->second = value;
		return true;
	}
	printf("WARNING: There is no parameter <%s>.\n", name.c_str());
	return false;
}

/** get parameter */
template<class T>
T GepParam<T>::getParam(string name) const
{
	auto found = params_.find(name);
	if (found != params_.end())
		return found->second;
	else
	{
		printf("WARNING: There is no parameter <%s>.\n", name.c_str());
		return T();
	}
}

class GepParams {
public:

	/** default constructor */
	GepParams();

	/** default destructor */
	virtual ~GepParams();

	/** read parameter file; returns the number of lines rejected */
	int readParamFile(const char * param_file);

private:
	/** INITIALIZE */
	void initBoolParams();
	void initIntParams();
	void initDblParams();
	void initStrParams();

public:
	/** SET */

	/** set boolean type parameter */
	bool setBoolParam(string name, bool value)
	{
		return BoolParams_.setParam(name, value);
	}

	/** set double type parameter */
	bool setDblParam(string name, double value)
	{
		return DblParams_.setParam(name, value);
	}

	/** set integer type parameter */
	bool setIntParam(string name, int value)
	{
		return IntParams_.setParam(name, value);
	}

	/** set string type parameter */
	bool setStrParam(string name, string value)
	{
		return StrParams_.setParam(name, value);
	}

	/** GET */

	/** get boolean type parameter */
	bool getBoolParam(string name) const {return BoolParams_.getParam(name);}

	/** get double type parameter */
	double getDblParam(string name) const {return DblParams_.getParam(name);}

	/** get integer type parameter */
	int getIntParam(string name) const {return IntParams_.getParam(name);}

	/** get string type parameter */
	string getStrParam(string name) const {return StrParams_.getParam(name);}

private:

	GepParam<bool>    BoolParams_;
	GepParam<double>  DblParams_;
	GepParam<int>     IntParams_;
	GepParam<string>  StrParams_;
};

#endif /* SRC_UTILITY_GEPPARAMS_H_ */
