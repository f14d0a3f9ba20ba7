// test_solvers.h
#ifndef TEST_SOLVERS_H_
#define TEST_SOLVERS_H_

#include "SolverInterface/GepOsiClp.h"
#include "Solver/Benders/BdMaster.h"
#include "Solver/Benders/BdSub.h"
#include "Solver/Benders/BdDriver.h"

/** Clp binding reporting a fixed status after solving */
class GepOsiClpStatus : public GepOsiClp {
public:
    GepOsiClpStatus(int status) : status_(status) {}
    virtual int status() {return status_;}
private:
    int status_;
};

/** master whose solver reports infeasibility */
class BdMasterInfeasible : public BdMaster {
public:
    BdMasterInfeasible(GepModel * model, GepParams * par, GepMessage * message, int after = 0) :
        BdMaster(model, par, message), nsolves_(0), after_(after) {}
protected:
    virtual GepOsi * createGepOsi() {
        if (nsolves_++ < after_)
            return new GepOsiClp();
        return new GepOsiClpStatus(GEP_STAT_PRIM_INFEASIBLE);
    }
private:
    int nsolves_;
    int after_;
};

/** subproblems whose first scenario reports infeasibility on the first solve */
class BdSubInfeasibleOnce : public BdSub {
public:
    BdSubInfeasibleOnce(GepModel * model, GepParams * par, GepMessage * message, int status) :
        BdSub(model, par, message), ncreated_(0), status_(status) {}
protected:
    virtual GepOsi * createGepOsi() {
        if (ncreated_++ == 0)
            return new GepOsiClpStatus(status_);
        return new GepOsiClp();
    }
private:
    int ncreated_;
    int status_;
};

/** driver with replaceable master and subproblems */
class BdDriverTest : public BdDriver {
public:
    BdDriverTest(GepModel * model, GepParams * par, GepMessage * message,
            int masterAfter = -1, int subStatus = GEP_STAT_OPTIMAL) :
        BdDriver(model, par, message), masterAfter_(masterAfter), subStatus_(subStatus) {}
protected:
    virtual BdMaster * createMaster() {
        if (masterAfter_ >= 0)
            return new BdMasterInfeasible(model_, par_, message_, masterAfter_);
        return BdDriver::createMaster();
    }
    virtual BdSub * createSub() {
        if (subStatus_ != GEP_STAT_OPTIMAL)
            return new BdSubInfeasibleOnce(model_, par_, message_, subStatus_);
        return BdDriver::createSub();
    }
private:
    int masterAfter_;
    int subStatus_;
};

#endif
