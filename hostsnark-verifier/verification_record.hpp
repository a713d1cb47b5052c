/** @file
 *****************************************************************************

 Declaration of verification records and the aggregate verification state.

 A record is created pending when an instruction is received and finalized
 exactly once, as accepted or rejected. Finalizing twice is a logic error.
 The host ledger stores records keyed by (owner, index) and never overwrites
 one.

 verification_state mirrors the program state account: how many proofs were
 accepted, the first 32 bytes of the last accepted prepared inputs and the
 host clock at that time.

 *****************************************************************************/

#ifndef HOSTSNARK_VERIFICATION_RECORD_HPP_
#define HOSTSNARK_VERIFICATION_RECORD_HPP_

#include <map>
#include <utility>

#include "hostsnark-verifier/instruction.hpp"

enum class verification_outcome : uint8_t {
    pending = 0,
    accepted = 1,
    rejected = 2
};

const char *verification_outcome_name(verification_outcome outcome);

class verification_record {
private:
    void finalize(verification_outcome outcome, int64_t clock);

public:
    account_id owner;
    uint64_t index;
    verification_outcome outcome;
    hostsnark_error_code error;
    boost::optional<bool> balance_sufficient;
    byte_vector prepared_inputs;
    int64_t finalized_at;

    verification_record(const account_id &owner, uint64_t index);

    void accept(const byte_vector &prepared_inputs, int64_t clock);
    void reject(hostsnark_error_code error, int64_t clock);

    bool is_final() const { return outcome != verification_outcome::pending; }
    bool is_accepted() const { return outcome == verification_outcome::accepted; }
};

std::ostream& operator<<(std::ostream &out, const verification_record &record);

class verification_state {
public:
    static const size_t ENCODED_SIZE = 8 + 32 + 8;

    uint64_t total_verifications;
    byte_vector last_amount;
    int64_t last_timestamp;

    verification_state() : total_verifications(0), last_amount(32, 0), last_timestamp(0) {}

    void record_acceptance(const verification_record &record);

    byte_vector encode() const;
    static verification_state decode(const byte_vector &bytes);
};

typedef std::pair<account_id, uint64_t> record_key;

/**
 * Everything the host persists. Only execution_host mutates it, and only
 * through commit once an outcome is final.
 */
class account_ledger {
public:
    std::map<record_key, verification_record> records;
    std::map<account_id, uint64_t> balances;
    verification_state state;

    /** Unknown accounts have balance 0 */
    uint64_t balance_of(const account_id &account) const;
    bool has_record(const account_id &owner, uint64_t index) const;
    boost::optional<verification_record> find_record(const account_id &owner, uint64_t index) const;

    void commit(const verification_record &record);
};

#endif // HOSTSNARK_VERIFICATION_RECORD_HPP_
