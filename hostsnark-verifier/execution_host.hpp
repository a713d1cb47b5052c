/** @file
 *****************************************************************************

 A deterministic, single threaded execution host for the verifier.

 execute runs one instruction as one transaction: a fresh compute meter, the
 verifier, then a commit of exactly one finalized record (and the state
 update if it was accepted). A transaction aborts without touching the
 ledger if the envelope cannot be parsed, the record key is taken, or the
 compute budget runs out.

 *****************************************************************************/

#ifndef HOSTSNARK_EXECUTION_HOST_HPP_
#define HOSTSNARK_EXECUTION_HOST_HPP_

#include "hostsnark-verifier/onchain_verifier.hpp"

enum class execution_status {
    committed,
    aborted
};

class execution_result {
public:
    execution_status status;
    std::string abort_reason;
    boost::optional<verification_record> record;
    uint64_t compute_units;

    execution_result() : status(execution_status::aborted), compute_units(0) {}

    bool committed() const { return status == execution_status::committed; }
};

class execution_host {
private:
    onchain_verifier verifier;
    verifier_config config;
    pairing_check_fn pairing_check;
    account_ledger ledger;
    int64_t clock;
    std::vector<std::string> program_log;

public:
    execution_host(const onchain_verifier &verifier,
                   const verifier_config &config,
                   const pairing_check_fn &pairing_check=alt_bn128_pairing_check);

    execution_result execute(const account_id &caller, const byte_vector &instruction_data);

    void set_balance(const account_id &account, uint64_t balance);
    void advance_clock(int64_t seconds);

    int64_t now() const { return clock; }
    const account_ledger &state() const { return ledger; }
    boost::optional<verification_record> find_record(const account_id &owner, uint64_t index) const;
    const std::vector<std::string> &log() const { return program_log; }
};

#endif // HOSTSNARK_EXECUTION_HOST_HPP_
