/** @file
 *****************************************************************************

 What a single host invocation hands to the verifier: metered access to the
 pairing primitive, read-only access to balances, the host clock and the
 program log. The verifier has no other way to reach host state.

 *****************************************************************************/

#ifndef HOSTSNARK_EXECUTION_CONTEXT_HPP_
#define HOSTSNARK_EXECUTION_CONTEXT_HPP_

#include <string>
#include <vector>

#include "hostsnark-verifier/compute_meter.hpp"
#include "hostsnark-verifier/pairing_check.hpp"
#include "hostsnark-verifier/verification_record.hpp"
#include "hostsnark-verifier/verifier_config.hpp"

class execution_context {
private:
    compute_meter &meter;
    const verifier_config &host_config;
    const pairing_check_fn &pairing_check;
    const account_ledger &ledger;
    std::vector<std::string> &program_log;

public:
    const int64_t clock;

    execution_context(compute_meter &meter,
                      const verifier_config &config,
                      const pairing_check_fn &pairing_check,
                      const account_ledger &ledger,
                      int64_t clock,
                      std::vector<std::string> &program_log) :
        meter(meter), host_config(config), pairing_check(pairing_check),
        ledger(ledger), program_log(program_log), clock(clock) {}

    /** Throws compute_budget_exceeded */
    void charge(uint64_t units, const std::string &operation);

    const verifier_config &config() const { return host_config; }

    /** Charged as pairing_base_cost + pairing_pair_cost * (pairs - 1) */
    pairing_result alt_bn128_pairing(const pairing_input &input);

    uint64_t balance_of(const account_id &account) const;

    void msg(const std::string &line);
};

#endif // HOSTSNARK_EXECUTION_CONTEXT_HPP_
