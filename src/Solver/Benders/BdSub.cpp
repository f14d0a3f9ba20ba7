/*
 * BdSub.cpp
 *
 *  Created on: Oct 19, 2026
 */

// #define GEP_DEBUG

#ifdef USE_OMP
#include <omp.h>
#endif

#include "CoinHelperFunctions.hpp"
#include "CoinPackedMatrix.hpp"
#include "Solver/Benders/BdSub.h"
#include "SolverInterface/GepOsiClp.h"

BdSub::BdSub(
		GepModel *   model,  /**< model pointer */
		GepParams *  par,    /**< parameters */
		GepMessage * message /**< message pointer */) :
model_(model),
par_(par),
message_(message),
nscen_(0),
voll_(1000.0)
{
	/** nothing to do */
}

BdSub::~BdSub()
{
	for (unsigned s = 0; s < osi_.size(); ++s)
		FREE_PTR(osi_[s]);
	osi_.clear();
}

GEP_RTN_CODE BdSub::init()
{
	if (!model_ || !model_->isValidated())
	{
		printf("Error: the model is not validated.\n");
		return GEP_RTN_DATA_ERR;
	}

	BGN_TRY_CATCH

	int ntechs = model_->getNumTechs();
	int nslices = model_->getNumSlices();

	nscen_ = model_->getNumScenarios();
	voll_ = par_->getDblParam("BD/VOLL");

	if (voll_ <= model_->getMaxMarginalCost())
		message_->print(0, "Warning: value of lost load %g does not exceed the largest marginal cost %g.\n",
				voll_, model_->getMaxMarginalCost());

	osi_.assign(nscen_, NULL);
	objvals_.assign(nscen_, 0.0);
	status_.assign(nscen_, GEP_STAT_NOT_SOLVED);
	lambda_.assign(nscen_, std::vector<double>(nslices, 0.0));
	rho_.assign(nscen_, std::vector<double>(ntechs, 0.0));
	dispatch_.assign(nscen_, std::vector<double>(ntechs * nslices, 0.0));
	lol_.assign(nscen_, std::vector<double>(nslices, 0.0));

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdSub::solve(const double * x)
{
	if (static_cast<int>(osi_.size()) != nscen_ || nscen_ == 0)
	{
		printf("Error: the subproblems are not initialized.\n");
		return GEP_RTN_ERR;
	}

	BGN_TRY_CATCH

	/** solver interfaces are created serially */
	for (int s = 0; s < nscen_; ++s)
	{
		FREE_PTR(osi_[s]);
		osi_[s] = createGepOsi();
		if (!osi_[s]) throw CoinError("Failed to create GepOsi", "solve", "BdSub");
		osi_[s]->setLogLevel(par_->getIntParam("BD/SUB/SOLVER/LOG_LEVEL"));
		osi_[s]->setTimeLimit(par_->getDblParam("BD/SUB/TIME_LIM"));
		status_[s] = GEP_STAT_NOT_SOLVED;
	}

	/** every scenario writes only its own slots */
#ifdef USE_OMP
	omp_set_num_threads(CoinMax(1, par_->getIntParam("BD/SUB/THREADS")));
#pragma omp parallel for schedule(dynamic)
#endif
	for (int s = 0; s < nscen_; ++s)
		solveOneScenario(this, s, x);

	for (int s = 0; s < nscen_; ++s)
		GEPdebugMessage("Scenario %d: status %d, objective %e\n", s, status_[s], objvals_[s]);

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

bool BdSub::isOptimal() const
{
	for (int s = 0; s < nscen_; ++s)
		if (status_[s] != GEP_STAT_OPTIMAL)
			return false;
	return nscen_ > 0;
}

bool BdSub::isInfeasible() const
{
	for (int s = 0; s < nscen_; ++s)
		if (status_[s] == GEP_STAT_PRIM_INFEASIBLE)
			return true;
	return false;
}

double BdSub::getExpectedObjective() const
{
	double expected = 0.0;
	for (int s = 0; s < nscen_; ++s)
		expected += model_->getProbability()[s] * objvals_[s];
	return expected;
}

GepOsi * BdSub::createGepOsi()
{
	return new GepOsiClp();
}

void BdSub::solveOneScenario(
		BdSub *        sub,
		int            s, /**< scenario index */
		const double * x  /**< investment vector */)
{
	BGN_TRY_CATCH

	const GepModel * model = sub->model_;
	OsiSolverInterface * si = sub->osi_[s]->si_;

	int ntechs = model->getNumTechs();
	int nslices = model->getNumSlices();
	int ncols = ntechs * nslices + nslices;
	int nrows = nslices + ntechs;
	const double * cost = model->getMarginalCost();
	const double * duration = model->getDuration();
	const double * width = model->getWidth(s);

	std::vector<double> clbd(ncols, 0.0);
	std::vector<double> cubd(ncols, si->getInfinity());
	std::vector<double> obj(ncols, 0.0);
	std::vector<double> rlbd(nrows, 0.0);
	std::vector<double> rubd(nrows, 0.0);

	/** objective */
	for (int i = 0; i < ntechs; ++i)
		for (int j = 0; j < nslices; ++j)
			obj[i * nslices + j] = cost[i] * duration[j];
	for (int j = 0; j < nslices; ++j)
		obj[ntechs * nslices + j] = sub->voll_ * duration[j];

	/** constraint matrix in row order */
	CoinPackedMatrix mat(false, 0, 0);
	mat.setDimensions(0, ncols);

	std::vector<int> ind;
	std::vector<double> elem;

	/** demand balance */
	for (int j = 0; j < nslices; ++j)
	{
		ind.clear();
		elem.clear();
		for (int i = 0; i < ntechs; ++i)
		{
			ind.push_back(i * nslices + j);
			elem.push_back(1.0);
		}
		ind.push_back(ntechs * nslices + j);
		elem.push_back(1.0);
		mat.appendRow(static_cast<int>(ind.size()), &ind[0], &elem[0]);
		rlbd[j] = width[j];
		rubd[j] = width[j];
	}

	/** capacity */
	for (int i = 0; i < ntechs; ++i)
	{
		ind.clear();
		elem.clear();
		for (int j = 0; j < nslices; ++j)
		{
			ind.push_back(i * nslices + j);
			elem.push_back(1.0);
		}
		mat.appendRow(static_cast<int>(ind.size()), &ind[0], &elem[0]);
		rlbd[nslices + i] = -si->getInfinity();
		rubd[nslices + i] = CoinMax(0.0, x[i]);
	}

	si->loadProblem(mat, &clbd[0], &cubd[0], &obj[0], &rlbd[0], &rubd[0]);

	/** solve from scratch */
	sub->osi_[s]->solve();

	sub->status_[s] = sub->osi_[s]->status();
	GEPdebugMessage("Scenario %d: status %d\n", s, sub->status_[s]);

	if (sub->status_[s] == GEP_STAT_OPTIMAL)
	{
		const double * sol = si->getColSolution();
		const double * pi = si->getRowPrice();

		sub->objvals_[s] = sub->osi_[s]->getPrimObjValue();
		CoinCopyN(sol, ntechs * nslices, &sub->dispatch_[s][0]);
		CoinCopyN(sol + ntechs * nslices, nslices, &sub->lol_[s][0]);
		CoinCopyN(pi, nslices, &sub->lambda_[s][0]);
		CoinCopyN(pi + nslices, ntechs, &sub->rho_[s][0]);
	}
	else
	{
		sub->objvals_[s] = COIN_DBL_MAX;
		CoinZeroN(&sub->lambda_[s][0], nslices);
		CoinZeroN(&sub->rho_[s][0], ntechs);
	}

	END_TRY_CATCH(sub->status_[s] = GEP_STAT_UNKNOWN;)
}
