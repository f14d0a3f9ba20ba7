/*
 * BdLog.cpp
 *
 *  Created on: Oct 19, 2026
 */

#include <fstream>
#include <iomanip>
#include <sstream>
#include "Utility/GepMacros.h"
#include "Solver/Benders/BdLog.h"

using namespace std;

BdLog::BdLog() :
ntechs_(0),
nthetas_(0),
nrecourse_(0),
has_summary_(false)
{
	/** nothing to do */
}

GEP_RTN_CODE BdLog::init(const GepModel * model, bool multicut)
{
	if (!columns_.empty())
	{
		printf("Error: the log columns are already fixed.\n");
		return GEP_RTN_ERR;
	}

	BGN_TRY_CATCH

	int nscen = model->getNumScenarios();
	ntechs_ = model->getNumTechs();
	nthetas_ = multicut ? nscen : 1;
	nrecourse_ = multicut ? nscen + 1 : 1;

	columns_.push_back("iter");
	for (int i = 0; i < ntechs_; ++i)
	{
		technames_.push_back(model->getTechName(i));
		columns_.push_back(model->getTechName(i));
	}
	if (multicut)
	{
		for (int s = 0; s < nscen; ++s)
		{
			ostringstream name;
			name << "theta_" << s + 1;
			columns_.push_back(name.str());
		}
	}
	else
		columns_.push_back("theta");
	columns_.push_back("investment_cost");
	columns_.push_back(model->isStochastic() ? "EQ" : "Q");
	if (multicut)
	{
		for (int s = 0; s < nscen; ++s)
		{
			ostringstream name;
			name << "Q_" << s + 1;
			columns_.push_back(name.str());
		}
	}
	columns_.push_back("LB");
	columns_.push_back("UB");
	columns_.push_back("gap");
	columns_.push_back("cut_type");

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

void BdLog::clear()
{
	columns_.clear();
	technames_.clear();
	records_.clear();
	summary_ = BdSummary();
	has_summary_ = false;
	ntechs_ = 0;
	nthetas_ = 0;
	nrecourse_ = 0;
}

GEP_RTN_CODE BdLog::record(const BdIterRecord & rec)
{
	if (columns_.empty())
	{
		printf("Error: the log is not initialized.\n");
		return GEP_RTN_ERR;
	}
	if (static_cast<int>(rec.x.size()) != ntechs_ ||
		static_cast<int>(rec.theta.size()) != nthetas_ ||
		static_cast<int>(rec.recourse.size()) != nrecourse_)
	{
		printf("Error: the iteration record does not match the log columns.\n");
		return GEP_RTN_ERR;
	}
	records_.push_back(rec);
	return GEP_RTN_OK;
}

void BdLog::flatten(const BdIterRecord & rec, vector<double> & values) const
{
	values.clear();
	values.insert(values.end(), rec.x.begin(), rec.x.end());
	values.insert(values.end(), rec.theta.begin(), rec.theta.end());
	values.push_back(rec.investment);
	values.insert(values.end(), rec.recourse.begin(), rec.recourse.end());
	values.push_back(rec.lb);
	values.push_back(rec.ub);
	values.push_back(rec.gap);
}

GEP_RTN_CODE BdLog::writeCsv(const string & prefix) const
{
	string iterfile = prefix + "_iterations.csv";
	string sumfile = prefix + "_summary.csv";

	BGN_TRY_CATCH

	ofstream fp(iterfile.c_str());
	if (!fp.is_open())
	{
		printf("Error: unable to open file %s.\n", iterfile.c_str());
		return GEP_RTN_ERR;
	}
	fp << setprecision(12);
	for (unsigned k = 0; k < columns_.size(); ++k)
		fp << (k > 0 ? "," : "") << columns_[k];
	fp << endl;

	vector<double> values;
	for (unsigned r = 0; r < records_.size(); ++r)
	{
		flatten(records_[r], values);
		fp << records_[r].iter;
		for (unsigned k = 0; k < values.size(); ++k)
			fp << "," << values[k];
		fp << "," << records_[r].cutType << endl;
	}
	fp.close();

	if (has_summary_)
	{
		ofstream fs(sumfile.c_str());
		if (!fs.is_open())
		{
			printf("Error: unable to open file %s.\n", sumfile.c_str());
			return GEP_RTN_ERR;
		}
		fs << setprecision(12);
		fs << "name,value" << endl;
		fs << "outcome," << gepStatusName(summary_.status) << endl;
		fs << "iterations," << summary_.iterations << endl;
		fs << "LB," << summary_.lb << endl;
		fs << "UB," << summary_.ub << endl;
		fs << "gap," << summary_.gap << endl;
		for (unsigned i = 0; i < summary_.x.size() && i < technames_.size(); ++i)
			fs << technames_[i] << "," << summary_.x[i] << endl;
		for (unsigned s = 0; s < summary_.theta.size(); ++s)
		{
			if (summary_.theta.size() == 1)
				fs << "theta," << summary_.theta[s] << endl;
			else
				fs << "theta_" << s + 1 << "," << summary_.theta[s] << endl;
		}
		for (unsigned j = 0; j < summary_.eens.size(); ++j)
			fs << "unserved_energy_" << j + 1 << "," << summary_.eens[j] << endl;
		fs << "wall_time," << summary_.walltime << endl;
		fs.close();
	}

	END_TRY_CATCH_RTN(;,GEP_RTN_ERR)

	return GEP_RTN_OK;
}

void BdLog::print(GepMessage * message) const
{
	message->print(1, "%6s %13s %13s %13s %10s  %s\n", "iter", "LB", "UB", "gap", "inv", "cut");
	for (unsigned r = 0; r < records_.size(); ++r)
	{
		const BdIterRecord & rec = records_[r];
		message->print(1, "%6d %+13.6e %+13.6e %+13.6e %10.4e  %s\n",
				rec.iter, rec.lb, rec.ub, rec.gap, rec.investment, rec.cutType.c_str());
		message->print(2, "  x:");
		for (unsigned i = 0; i < rec.x.size(); ++i)
			message->print(2, " %s=%g", technames_[i].c_str(), rec.x[i]);
		message->print(2, "\n");
	}
	if (has_summary_)
		message->print(1, "Outcome: %s after %d iterations, LB %e, UB %e, gap %e\n",
				gepStatusName(summary_.status), summary_.iterations,
				summary_.lb, summary_.ub, summary_.gap);
}
