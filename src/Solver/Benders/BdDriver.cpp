/*
 * BdDriver.cpp
 *
 *  Created on: Oct 19, 2026
 */

// #define GEP_DEBUG

#include <limits>
#include "CoinHelperFunctions.hpp"
#include "Utility/GepMacros.h"
#include "Solver/Benders/BdDriver.h"
#include "Solver/Benders/BdCutGen.h"

BdDriver::BdDriver(
		GepModel *   model,  /**< model pointer */
		GepParams *  par,    /**< parameters */
		GepMessage * message /**< message pointer */):
GepSolver(model, par, message),
master_(NULL),
sub_(NULL),
state_(BD_STATE_INIT),
multicut_(false),
gap_(COIN_DBL_MAX),
evaluated_(false)
{
	/** nothing to do */
}

BdDriver::~BdDriver()
{
	FREE_PTR(master_);
	FREE_PTR(sub_);
}

GEP_RTN_CODE BdDriver::init()
{
	if (!model_)
	{
		printf("Error: Null model pointer.\n");
		return GEP_RTN_ERR;
	}

	/** validate data; no optimization starts on failure */
	if (!model_->isValidated())
		GEP_RTN_CHECK_RTN_CODE(model_->validate(par_->getDblParam("DATA/PROB_TOL")));

	BGN_TRY_CATCH

	multicut_ = par_->getBoolParam("BD/MULTI_CUT");
	iterlim_ = par_->getIntParam("BD/ITER_LIM");
	time_remains_ = par_->getDblParam("BD/WALL_LIM");

	FREE_PTR(master_);
	FREE_PTR(sub_);
	master_ = createMaster();
	sub_ = createSub();
	if (!master_ || !sub_)
		throw CoinError("Failed to create the master or the subproblems", "init", "BdDriver");

	GEP_RTN_CHECK_THROW(master_->init());
	GEP_RTN_CHECK_THROW(sub_->init());
	log_.clear();
	GEP_RTN_CHECK_THROW(log_.init(model_, multicut_));

	primsol_.assign(model_->getNumTechs(), 0.0);
	theta_.assign(master_->getNumThetas(), 0.0);
	bestprimobj_ = COIN_DBL_MAX;
	bestdualobj_ = -COIN_DBL_MAX;
	gap_ = COIN_DBL_MAX;
	numIterations_ = 0;
	status_ = GEP_STAT_NOT_SOLVED;
	state_ = BD_STATE_INIT;
	evaluated_ = false;

	message_->print(1, "Benders decomposition: %d technologies, %d slices, %d scenarios, %s cuts\n",
			model_->getNumTechs(), model_->getNumSlices(), model_->getNumScenarios(),
			multicut_ ? "multiple" : "aggregate");

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdDriver::solve()
{
	if (!master_ || !sub_)
	{
		printf("Error: the driver is not initialized.\n");
		return GEP_RTN_ERR;
	}

	int ntechs = model_->getNumTechs();
	int nscen = model_->getNumScenarios();
	int nthetas = master_->getNumThetas();
	double inf = std::numeric_limits<double>::infinity();
	double stime = CoinGetTimeOfDay();
	double ctime = CoinCpuTime();

	std::vector<double> gradient(ntechs, 0.0);
	double intercept = 0.0;

	BGN_TRY_CATCH

	tic();
	while (true)
	{
		if (numIterations_ >= iterlim_)
		{
			message_->print(1, "Iteration limit %d is reached.\n", iterlim_);
			status_ = GEP_STAT_STOPPED_ITER;
			break;
		}
		ticToc();
		if (time_remains_ < 0.0)
		{
			message_->print(1, "Wall clock limit is reached.\n");
			status_ = GEP_STAT_STOPPED_TIME;
			break;
		}

		/** master */
		state_ = BD_STATE_SOLVING_MASTER;
		GEP_RTN_CHECK_THROW(master_->solve());
		if (master_->getStatus() != GEP_STAT_OPTIMAL)
		{
			message_->print(0, "Error: the master problem is not solved to optimality (status %d).\n",
					master_->getStatus());
			state_ = BD_STATE_ABORTED;
			status_ = GEP_STAT_ABORT;
			break;
		}
		numIterations_++;

		CoinCopyN(master_->getPrimalSolution(), ntechs, &primsol_[0]);
		CoinCopyN(master_->getTheta(), nthetas, &theta_[0]);
		bestdualobj_ = master_->getPrimalObjective();
		primobj_ = model_->getInvestmentCost(&primsol_[0]);

		/** subproblems; results are complete when solve returns */
		state_ = BD_STATE_SOLVING_SUBPROBLEMS;
		GEP_RTN_CHECK_THROW(sub_->solve(&primsol_[0]));
		evaluated_ = true;

		BdIterRecord rec;
		rec.iter = numIterations_;
		rec.x = primsol_;
		rec.theta = theta_;
		rec.investment = primobj_;
		rec.lb = bestdualobj_;

		if (sub_->isInfeasible())
		{
			for (int s = 0; s < nscen; ++s)
			{
				if (sub_->getStatus(s) != GEP_STAT_PRIM_INFEASIBLE) continue;
				message_->print(0, "Warning: the subproblem of scenario %d is infeasible; a feasibility cut is added.\n", s);
				GEP_RTN_CHECK_THROW(master_->addFeasibilityCut(s));
			}
			gap_ = bestprimobj_ < COIN_DBL_MAX ? bestprimobj_ - bestdualobj_ : inf;
			rec.recourse.assign(multicut_ ? nscen + 1 : 1, std::numeric_limits<double>::quiet_NaN());
			rec.ub = bestprimobj_ < COIN_DBL_MAX ? bestprimobj_ : inf;
			rec.gap = gap_;
			rec.cutType = BD_TAG_FEASIBILITY;
			GEP_RTN_CHECK_THROW(log_.record(rec));
			continue;
		}

		if (!sub_->isOptimal())
		{
			for (int s = 0; s < nscen; ++s)
				if (sub_->getStatus(s) != GEP_STAT_OPTIMAL)
					message_->print(0, "Error: the subproblem of scenario %d has status %d.\n", s, sub_->getStatus(s));
			state_ = BD_STATE_ABORTED;
			status_ = GEP_STAT_STOPPED_UNKNOWN;
			break;
		}

		/** bounds */
		double expected = sub_->getExpectedObjective();
		primobj_ += expected;
		bestprimobj_ = CoinMin(bestprimobj_, primobj_);
		gap_ = bestprimobj_ - bestdualobj_;

		rec.recourse.push_back(expected);
		if (multicut_)
			for (int s = 0; s < nscen; ++s)
				rec.recourse.push_back(sub_->getObjective(s));
		rec.ub = bestprimobj_;
		rec.gap = gap_;

		message_->print(2, "Iteration %d: LB %e, UB %e, gap %e\n",
				numIterations_, bestdualobj_, bestprimobj_, gap_);

		rec.cutType = multicut_ ? BD_TAG_MULTI_CUT : BD_TAG_OPTIMALITY;
		if (isConverged())
		{
			/** no cut is added on the converged iteration */
			GEP_RTN_CHECK_THROW(log_.record(rec));
			state_ = BD_STATE_CONVERGED;
			status_ = GEP_STAT_OPTIMAL;
			break;
		}

		/** cuts */
		if (multicut_)
		{
			for (int s = 0; s < nscen; ++s)
			{
				GEP_RTN_CHECK_THROW(BdCutGen::generateScenarioCut(model_, sub_, s, intercept, &gradient[0]));
				GEP_RTN_CHECK_THROW(master_->addOptimalityCut(intercept, &gradient[0], s));
			}
		}
		else
		{
			GEP_RTN_CHECK_THROW(BdCutGen::generateAggregateCut(model_, sub_, intercept, &gradient[0]));
			GEP_RTN_CHECK_THROW(master_->addOptimalityCut(intercept, &gradient[0]));
		}
		GEP_RTN_CHECK_THROW(log_.record(rec));
	}

	END_TRY_CATCH_RTN(state_ = BD_STATE_ABORTED; status_ = GEP_STAT_STOPPED_UNKNOWN; summarize();,GEP_RTN_ERR)

	walltime_ = CoinGetTimeOfDay() - stime;
	cputime_ = CoinCpuTime() - ctime;
	summarize();

	if (status_ == GEP_STAT_ABORT)
		return GEP_RTN_MASTER_ERR;
	if (status_ == GEP_STAT_STOPPED_UNKNOWN)
		return GEP_RTN_ERR;

	return GEP_RTN_OK;
}

GEP_RTN_CODE BdDriver::finalize()
{
	log_.print(message_);

	if (par_->getBoolParam("OUTPUT/WRITE"))
		GEP_RTN_CHECK_RTN_CODE(log_.writeCsv(par_->getStrParam("OUTPUT/PREFIX")));

	return GEP_RTN_OK;
}

BdMaster * BdDriver::createMaster()
{
	return new BdMaster(model_, par_, message_);
}

BdSub * BdDriver::createSub()
{
	return new BdSub(model_, par_, message_);
}

bool BdDriver::isConverged() const
{
	double gaptol = par_->getDblParam("BD/GAP_TOL");
	double relgaptol = par_->getDblParam("BD/REL_GAP_TOL");

	if (fabs(gap_) <= gaptol)
		return true;
	if (relgaptol > 0.0 && fabs(gap_) / (1.0e-10 + fabs(bestprimobj_)) <= relgaptol)
		return true;
	return false;
}

void BdDriver::summarize()
{
	double inf = std::numeric_limits<double>::infinity();

	BdSummary summary;
	summary.x = primsol_;
	summary.theta = theta_;
	summary.lb = bestdualobj_;
	summary.ub = bestprimobj_ < COIN_DBL_MAX ? bestprimobj_ : inf;
	summary.gap = bestprimobj_ < COIN_DBL_MAX ? gap_ : inf;
	summary.status = status_;
	summary.iterations = numIterations_;
	summary.walltime = walltime_;

	/** expected unserved energy at the last evaluated investment */
	int nslices = model_->getNumSlices();
	summary.eens.assign(nslices, 0.0);
	if (evaluated_ && sub_->isOptimal())
	{
		for (int s = 0; s < model_->getNumScenarios(); ++s)
			for (int j = 0; j < nslices; ++j)
				summary.eens[j] += model_->getProbability()[s] * model_->getDuration()[j]
						* sub_->getUnservedEnergy(s)[j];
	}

	log_.setSummary(summary);
}
