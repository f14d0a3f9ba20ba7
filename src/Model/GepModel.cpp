/*
 * GepModel.cpp
 *
 *  Created on: Oct 19, 2026
 */

// #define GEP_DEBUG

#include <cmath>
#include <set>
#include "CoinHelperFunctions.hpp"
#include "Utility/GepMacros.h"
#include "Utility/GepMessage.h"
#include "Model/GepModel.h"

GepModel::GepModel() :
stochastic_(false),
validated_(false)
{
	/** nothing to do */
}

GepModel::~GepModel()
{
	/** nothing to do */
}

GEP_RTN_CODE GepModel::loadTechnologies(
		int                 ntechs,  /**< number of technologies */
		const std::string * names,   /**< technology names */
		const double *      cost,    /**< marginal (operating) costs */
		const double *      invcost  /**< investment costs per unit capacity */)
{
	if (validated_)
	{
		printf("Error: the model is locked.\n");
		return GEP_RTN_ERR;
	}

	if (ntechs <= 0 || !names || !cost || !invcost)
	{
		printf("Error: invalid technology data.\n");
		return GEP_RTN_DATA_ERR;
	}

	BGN_TRY_CATCH

	names_.assign(names, names + ntechs);
	cost_.assign(cost, cost + ntechs);
	invcost_.assign(invcost, invcost + ntechs);

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE GepModel::loadSlices(
		int            nslices,  /**< number of demand slices */
		const double * duration, /**< slice durations */
		const double * minlevel, /**< minimum demand levels */
		const double * maxlevel  /**< maximum demand levels */)
{
	if (validated_)
	{
		printf("Error: the model is locked.\n");
		return GEP_RTN_ERR;
	}

	if (nslices <= 0 || !duration)
	{
		printf("Error: invalid demand slice data.\n");
		return GEP_RTN_DATA_ERR;
	}

	BGN_TRY_CATCH

	duration_.assign(duration, duration + nslices);
	minlevel_.assign(nslices, 0.0);
	maxlevel_.assign(nslices, 0.0);
	if (minlevel && maxlevel)
	{
		minlevel_.assign(minlevel, minlevel + nslices);
		maxlevel_.assign(maxlevel, maxlevel + nslices);
	}

	/** deterministic widths, unless a scenario table is already loaded */
	if (!stochastic_)
	{
		prob_.assign(1, 1.0);
		width_.assign(1, std::vector<double>(nslices, 0.0));
		for (int j = 0; j < nslices; ++j)
			width_[0][j] = maxlevel_[j] - minlevel_[j];
	}

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE GepModel::loadScenarios(
		int                    nscen, /**< number of scenarios */
		const double *         prob,  /**< scenario probabilities */
		const double * const * width  /**< slice widths for each scenario */)
{
	if (validated_)
	{
		printf("Error: the model is locked.\n");
		return GEP_RTN_ERR;
	}

	if (duration_.empty())
	{
		printf("Error: demand slices should be loaded before scenarios.\n");
		return GEP_RTN_DATA_ERR;
	}

	if (nscen <= 0 || !prob || !width)
	{
		printf("Error: invalid scenario data.\n");
		return GEP_RTN_DATA_ERR;
	}

	BGN_TRY_CATCH

	int nslices = getNumSlices();
	prob_.assign(prob, prob + nscen);
	width_.resize(nscen);
	for (int s = 0; s < nscen; ++s)
	{
		if (!width[s])
			throw CoinError("Missing scenario widths", "loadScenarios", "GepModel");
		width_[s].assign(width[s], width[s] + nslices);
	}
	stochastic_ = true;

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE GepModel::validate(double probtol)
{
	if (names_.empty())
	{
		printf("Error: no technology is given.\n");
		return GEP_RTN_DATA_ERR;
	}
	if (duration_.empty())
	{
		printf("Error: no demand slice is given.\n");
		return GEP_RTN_DATA_ERR;
	}

	/** technologies */
	std::set<std::string> unique_names;
	for (int i = 0; i < getNumTechs(); ++i)
	{
		if (names_[i].empty())
		{
			printf("Error: technology %d has no name.\n", i);
			return GEP_RTN_DATA_ERR;
		}
		if (unique_names.insert(names_[i]).second == false)
		{
			printf("Error: duplicate technology name <%s>.\n", names_[i].c_str());
			return GEP_RTN_DATA_ERR;
		}
		if (!(cost_[i] >= 0.0) || !(invcost_[i] >= 0.0))
		{
			printf("Error: technology <%s> has a negative cost.\n", names_[i].c_str());
			return GEP_RTN_DATA_ERR;
		}
		if (std::isinf(cost_[i]) || std::isinf(invcost_[i]))
		{
			printf("Error: technology <%s> has an infinite cost.\n", names_[i].c_str());
			return GEP_RTN_DATA_ERR;
		}
	}

	/** slices */
	for (int j = 0; j < getNumSlices(); ++j)
	{
		if (!(duration_[j] > 0.0) || std::isinf(duration_[j]))
		{
			printf("Error: demand slice %d has a non-positive or infinite duration.\n", j);
			return GEP_RTN_DATA_ERR;
		}
		if (maxlevel_[j] < minlevel_[j])
		{
			printf("Error: demand slice %d has max_level < min_level.\n", j);
			return GEP_RTN_DATA_ERR;
		}
	}

	/** scenarios */
	if (prob_.empty() || width_.size() != prob_.size())
	{
		printf("Error: inconsistent scenario data.\n");
		return GEP_RTN_DATA_ERR;
	}
	double probsum = 0.0;
	for (int s = 0; s < getNumScenarios(); ++s)
	{
		if (!(prob_[s] > 0.0 && prob_[s] <= 1.0))
		{
			printf("Error: scenario %d has probability %e outside (0,1].\n", s, prob_[s]);
			return GEP_RTN_DATA_ERR;
		}
		probsum += prob_[s];
		if (static_cast<int>(width_[s].size()) != getNumSlices())
		{
			printf("Error: scenario %d has %d widths for %d slices.\n",
					s, static_cast<int>(width_[s].size()), getNumSlices());
			return GEP_RTN_DATA_ERR;
		}
		for (int j = 0; j < getNumSlices(); ++j)
		{
			if (!(width_[s][j] >= 0.0) || std::isinf(width_[s][j]))
			{
				printf("Error: slice %d of scenario %d has an invalid width %e.\n", j, s, width_[s][j]);
				return GEP_RTN_DATA_ERR;
			}
		}
	}
	if (fabs(probsum - 1.0) > probtol)
	{
		printf("Error: scenario probabilities sum to %.10f.\n", probsum);
		return GEP_RTN_DATA_ERR;
	}
	GEPdebugMessage("validated %d technologies, %d slices, %d scenarios\n",
			getNumTechs(), getNumSlices(), getNumScenarios());

	validated_ = true;

	return GEP_RTN_OK;
}

double GepModel::getMaxWidth(int s) const
{
	double maxwidth = 0.0;
	for (unsigned j = 0; j < width_[s].size(); ++j)
		maxwidth = CoinMax(maxwidth, width_[s][j]);
	return maxwidth;
}

double GepModel::getMaxMarginalCost() const
{
	double maxcost = 0.0;
	for (unsigned i = 0; i < cost_.size(); ++i)
		maxcost = CoinMax(maxcost, cost_[i]);
	return maxcost;
}

double GepModel::getInvestmentCost(const double * x) const
{
	double invest = 0.0;
	for (unsigned i = 0; i < invcost_.size(); ++i)
		invest += invcost_[i] * x[i];
	return invest;
}
