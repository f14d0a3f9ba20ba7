/*
 * BdMaster.cpp
 *
 *  Created on: Oct 19, 2026
 */

// #define GEP_DEBUG

#include "CoinHelperFunctions.hpp"
#include "CoinPackedMatrix.hpp"
#include "Utility/GepMacros.h"
#include "Solver/Benders/BdMaster.h"
#include "Solver/Benders/BdCutGen.h"
#include "SolverInterface/GepOsiClp.h"

BdMaster::BdMaster(
		GepModel *   model,  /**< model pointer */
		GepParams *  par,    /**< parameter pointer */
		GepMessage * message /**< message pointer */) :
GepSolver(model, par, message),
osi_(NULL),
multicut_(false),
ntechs_(0),
nthetas_(0)
{
	/** nothing to do */
}

BdMaster::~BdMaster()
{
	FREE_PTR(osi_);
}

GEP_RTN_CODE BdMaster::init()
{
	if (!model_ || !model_->isValidated())
	{
		printf("Error: the model is not validated.\n");
		return GEP_RTN_DATA_ERR;
	}

	BGN_TRY_CATCH

	multicut_ = par_->getBoolParam("BD/MULTI_CUT");
	ntechs_ = model_->getNumTechs();
	nthetas_ = multicut_ ? model_->getNumScenarios() : 1;
	cuts_.clear();
	primsol_.assign(ntechs_ + nthetas_, 0.0);
	status_ = GEP_STAT_NOT_SOLVED;

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdMaster::solve()
{
	BGN_TRY_CATCH

	GEP_RTN_CHECK_THROW(createProblem());

	osi_->solve();
	status_ = osi_->status();
	GEPdebugMessage("Master status %d\n", status_);

	if (status_ == GEP_STAT_OPTIMAL)
	{
		primobj_ = osi_->getPrimObjValue();
		CoinCopyN(osi_->si_->getColSolution(), ntechs_ + nthetas_, &primsol_[0]);
		numIterations_++;
	}
	else
		message_->print(1, "Master problem status %d.\n", status_);

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdMaster::addOptimalityCut(
		double         intercept, /**< cut intercept */
		const double * gradient,  /**< cut gradient */
		int            scenario   /**< scenario index in multi-cut mode */)
{
	if (multicut_ && (scenario < 0 || scenario >= nthetas_))
	{
		printf("Error: invalid scenario index %d for a multi-cut.\n", scenario);
		return GEP_RTN_ERR;
	}
	if (!multicut_ && scenario != -1)
	{
		printf("Error: scenario index %d is given for an aggregate cut.\n", scenario);
		return GEP_RTN_ERR;
	}

	BGN_TRY_CATCH

	BdCut cut;
	cut.type = BD_CUT_OPTIMALITY;
	cut.scenario = scenario;
	cut.intercept = intercept;
	cut.gradient.assign(gradient, gradient + ntechs_);
	cuts_.push_back(cut);

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdMaster::addFeasibilityCut(int scenario)
{
	if (scenario < 0 || scenario >= model_->getNumScenarios())
	{
		printf("Error: invalid scenario index %d.\n", scenario);
		return GEP_RTN_ERR;
	}

	BGN_TRY_CATCH

	BdCut cut;
	cut.type = BD_CUT_FEASIBILITY;
	cut.scenario = scenario;
	cut.intercept = BdCutGen::feasibilityCutRhs(model_, scenario);
	cut.gradient.assign(ntechs_, 1.0);
	cuts_.push_back(cut);

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GepOsi * BdMaster::createGepOsi()
{
	return new GepOsiClp();
}

GEP_RTN_CODE BdMaster::createProblem()
{
	int ncols = ntechs_ + nthetas_;
	int nrows = getNumCuts();

	BGN_TRY_CATCH

	FREE_PTR(osi_);
	osi_ = createGepOsi();
	if (!osi_) throw CoinError("Failed to create GepOsi", "createProblem", "BdMaster");
	osi_->setLogLevel(par_->getIntParam("BD/MASTER/SOLVER/LOG_LEVEL"));
	osi_->setTimeLimit(par_->getDblParam("BD/MASTER/TIME_LIM"));

	double inf = osi_->si_->getInfinity();
	std::vector<double> clbd(ncols, 0.0);
	std::vector<double> cubd(ncols, inf);
	std::vector<double> obj(ncols, 0.0);
	std::vector<double> rlbd(nrows, 0.0);
	std::vector<double> rubd(nrows, inf);

	/** objective */
	CoinCopyN(model_->getInvestmentCost(), ntechs_, &obj[0]);
	if (multicut_)
		CoinCopyN(model_->getProbability(), nthetas_, &obj[ntechs_]);
	else
		obj[ntechs_] = 1.0;

	/** cuts */
	CoinPackedMatrix mat(false, 0, 0);
	mat.setDimensions(0, ncols);

	std::vector<int> ind;
	std::vector<double> elem;
	for (int k = 0; k < nrows; ++k)
	{
		const BdCut & cut = cuts_[k];
		ind.clear();
		elem.clear();
		if (cut.type == BD_CUT_OPTIMALITY)
		{
			ind.push_back(ntechs_ + (multicut_ ? cut.scenario : 0));
			elem.push_back(1.0);
			for (int i = 0; i < ntechs_; ++i)
			{
				if (cut.gradient[i] == 0.0) continue;
				ind.push_back(i);
				elem.push_back(-cut.gradient[i]);
			}
		}
		else
		{
			for (int i = 0; i < ntechs_; ++i)
			{
				ind.push_back(i);
				elem.push_back(cut.gradient[i]);
			}
		}
		mat.appendRow(static_cast<int>(ind.size()), &ind[0], &elem[0]);
		rlbd[k] = cut.intercept;
	}

	osi_->si_->loadProblem(mat, &clbd[0], &cubd[0], &obj[0],
			nrows > 0 ? &rlbd[0] : NULL, nrows > 0 ? &rubd[0] : NULL);
	GEPdebugMessage("Master problem: %d columns, %d rows\n", ncols, nrows);

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}
