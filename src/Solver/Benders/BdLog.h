/*
 * BdLog.h
 *
 *  Created on: Oct 19, 2026
 */

#ifndef SRC_SOLVER_BENDERS_BDLOG_H_
#define SRC_SOLVER_BENDERS_BDLOG_H_

#include <string>
#include <vector>
#include "Utility/GepRtnCodes.h"
#include "Utility/GepMessage.h"
#include "Model/GepModel.h"

/** cut type tags */
#define BD_TAG_OPTIMALITY "optimality"
#define BD_TAG_MULTI_CUT  "optimality_multi_cut"
#define BD_TAG_FEASIBILITY "feasibility"

/** one row of the iteration log */
struct BdIterRecord {
	int iter;                     /**< iteration index (from 1) */
	std::vector<double> x;        /**< investment levels */
	std::vector<double> theta;    /**< recourse column values */
	double investment;            /**< investment cost of x */
	std::vector<double> recourse; /**< expected recourse, then per-scenario recourse in multi-cut mode */
	double lb;                    /**< lower bound */
	double ub;                    /**< upper bound */
	double gap;                   /**< ub - lb */
	std::string cutType;          /**< cut type tag */
};

/** final summary of a run */
struct BdSummary {
	std::vector<double> x;     /**< final investment levels */
	std::vector<double> theta; /**< final recourse column values */
	std::vector<double> eens;  /**< expected unserved energy by slice */
	double lb;                 /**< final lower bound */
	double ub;                 /**< final upper bound */
	double gap;                /**< final gap */
	int status;                /**< outcome */
	int iterations;            /**< number of iterations */
	double walltime;           /**< wall clock time */

	BdSummary() : lb(0.0), ub(0.0), gap(0.0), status(GEP_STAT_NOT_SOLVED), iterations(0), walltime(0.0) {}
};

/**
 * Append-only iteration log. The column list is fixed by init().
 */
class BdLog {
public:

	BdLog();

	virtual ~BdLog() {}

	/** fix the column list */
	GEP_RTN_CODE init(const GepModel * model, bool multicut);

	/** drop the columns, the records and the summary */
	void clear();

	/** append a record; its shape must match the columns */
	GEP_RTN_CODE record(const BdIterRecord & rec);

	/** store the final summary */
	void setSummary(const BdSummary & summary) {summary_ = summary; has_summary_ = true;}

	/** write <prefix>_iterations.csv and <prefix>_summary.csv */
	GEP_RTN_CODE writeCsv(const std::string & prefix) const;

	/** print the iteration table */
	void print(GepMessage * message) const;

public:

	const std::vector<std::string> & getColumns() const {return columns_;}
	int getNumRecords() const {return static_cast<int>(records_.size());}
	const BdIterRecord & getRecord(int i) const {return records_[i];}
	const BdSummary & getSummary() const {return summary_;}
	bool hasSummary() const {return has_summary_;}

private:

	/** values of a record in column order */
	void flatten(const BdIterRecord & rec, std::vector<double> & values) const;

private:

	std::vector<std::string> columns_;  /**< column names */
	std::vector<std::string> technames_; /**< technology names */
	int ntechs_;    /**< number of technology columns */
	int nthetas_;   /**< number of theta columns */
	int nrecourse_; /**< number of recourse columns */

	std::vector<BdIterRecord> records_; /**< iteration records */
	BdSummary summary_;                 /**< final summary */
	bool has_summary_;
};

#endif /* SRC_SOLVER_BENDERS_BDLOG_H_ */
