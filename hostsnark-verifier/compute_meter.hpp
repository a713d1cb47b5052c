/** @file
 *****************************************************************************

 Compute unit meter for one host invocation. Running out of budget is not a
 verification outcome: compute_budget_exceeded unwinds to the host, which
 aborts the transaction without writing anything.

 *****************************************************************************/

#ifndef HOSTSNARK_COMPUTE_METER_HPP_
#define HOSTSNARK_COMPUTE_METER_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

class compute_budget_exceeded : public std::runtime_error {
public:
    explicit compute_budget_exceeded(const std::string &what) : std::runtime_error(what) {}
};

class compute_meter {
private:
    uint64_t budget;
    uint64_t consumed;

public:
    explicit compute_meter(uint64_t budget) : budget(budget), consumed(0) {}

    void consume(uint64_t units, const std::string &operation);

    uint64_t units_consumed() const { return consumed; }
};

#endif // HOSTSNARK_COMPUTE_METER_HPP_
