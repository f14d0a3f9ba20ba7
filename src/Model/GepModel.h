/*
 * GepModel.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_MODEL_GEPMODEL_H_
#define SRC_MODEL_GEPMODEL_H_

#include <string>
#include <vector>
#include "Utility/GepRtnCodes.h"

/**
 * Input data of the capacity expansion problem: technologies, demand slices
 * and, for stochastic instances, demand scenarios.
 *
 * A model without a scenario table is deterministic and carries a single
 * implicit scenario of probability one whose widths are max_level - min_level.
 * The model is locked by a successful validate(); load functions fail afterwards.
 */
class GepModel {
public:

	/** default constructor */
	GepModel();

	/** default destructor */
	virtual ~GepModel();

	/** load technologies */
	GEP_RTN_CODE loadTechnologies(
			int                 ntechs,  /**< number of technologies */
			const std::string * names,   /**< technology names */
			const double *      cost,    /**< marginal (operating) costs */
			const double *      invcost  /**< investment costs per unit capacity */);

	/** load demand slices; levels may be NULL when widths come from scenarios */
	GEP_RTN_CODE loadSlices(
			int            nslices,  /**< number of demand slices */
			const double * duration, /**< slice durations */
			const double * minlevel, /**< minimum demand levels */
			const double * maxlevel  /**< maximum demand levels */);

	/** load slice durations only; widths come from loadScenarios */
	GEP_RTN_CODE loadDurations(int nslices, const double * duration) {
		return loadSlices(nslices, duration, NULL, NULL);
	}

	/** load scenarios; width[s][j] is the width of slice j in scenario s */
	GEP_RTN_CODE loadScenarios(
			int                    nscen, /**< number of scenarios */
			const double *         prob,  /**< scenario probabilities */
			const double * const * width  /**< slice widths for each scenario */);

	/** check data consistency and lock the model */
	GEP_RTN_CODE validate(double probtol = 1.0e-6);

public:

	int getNumTechs() const {return static_cast<int>(names_.size());}
	int getNumSlices() const {return static_cast<int>(duration_.size());}
	int getNumScenarios() const {return static_cast<int>(prob_.size());}

	const std::string & getTechName(int i) const {return names_[i];}
	const double * getMarginalCost() const {return &cost_[0];}
	const double * getInvestmentCost() const {return &invcost_[0];}
	const double * getDuration() const {return &duration_[0];}
	const double * getProbability() const {return &prob_[0];}

	/** slice widths of scenario s */
	const double * getWidth(int s) const {return &width_[s][0];}

	/** largest slice width of scenario s */
	double getMaxWidth(int s) const;

	/** maximum marginal cost over technologies */
	double getMaxMarginalCost() const;

	/** investment cost of a capacity vector */
	double getInvestmentCost(const double * x) const;

	bool isStochastic() const {return stochastic_;}
	bool isValidated() const {return validated_;}

private:

	std::vector<std::string> names_;   /**< technology names */
	std::vector<double> cost_;         /**< marginal costs */
	std::vector<double> invcost_;      /**< investment costs */
	std::vector<double> duration_;     /**< slice durations */
	std::vector<double> minlevel_;     /**< slice minimum levels */
	std::vector<double> maxlevel_;     /**< slice maximum levels */
	std::vector<double> prob_;         /**< scenario probabilities */
	std::vector<std::vector<double> > width_; /**< slice widths [scenario][slice] */

	bool stochastic_; /**< scenario table loaded */
	bool validated_;  /**< validated and locked */
};

#endif /* SRC_MODEL_GEPMODEL_H_ */
