/** @file
 *****************************************************************************

 Implementation of verification records, see verification_record.hpp

 *****************************************************************************/

#include <algorithm>
#include <stdexcept>

#include "hostsnark-verifier/verification_record.hpp"

const char *verification_outcome_name(verification_outcome outcome)
{
    switch (outcome) {
        case verification_outcome::pending:
            return "pending";
        case verification_outcome::accepted:
            return "accepted";
        case verification_outcome::rejected:
            return "rejected";
    }
    return "unknown";
}

verification_record::verification_record(const account_id &owner, uint64_t index) :
    owner(owner), index(index),
    outcome(verification_outcome::pending),
    error(hostsnark_error_code::none),
    finalized_at(0)
{
}

void verification_record::finalize(verification_outcome outcome, int64_t clock)
{
    if (is_final())
    {
        throw std::logic_error("verification record is already finalized");
    }
    this->outcome = outcome;
    this->finalized_at = clock;
}

void verification_record::accept(const byte_vector &prepared_inputs, int64_t clock)
{
    finalize(verification_outcome::accepted, clock);
    this->prepared_inputs = prepared_inputs;
}

void verification_record::reject(hostsnark_error_code error, int64_t clock)
{
    if (error == hostsnark_error_code::none)
    {
        throw std::logic_error("rejected record needs an error code");
    }
    finalize(verification_outcome::rejected, clock);
    this->error = error;
}

std::ostream& operator<<(std::ostream &out, const verification_record &record)
{
    out << "record " << record.index << " " << verification_outcome_name(record.outcome);
    if (record.outcome == verification_outcome::rejected)
    {
        out << " (" << record.error << ")";
    }
    if (record.balance_sufficient)
    {
        out << " balance_sufficient=" << (*record.balance_sufficient ? "true" : "false");
    }
    return out;
}

const size_t verification_state::ENCODED_SIZE;

void verification_state::record_acceptance(const verification_record &record)
{
    total_verifications++;
    last_amount.assign(record.prepared_inputs.begin(),
                       record.prepared_inputs.begin() + std::min<size_t>(32, record.prepared_inputs.size()));
    last_amount.resize(32, 0);
    last_timestamp = record.finalized_at;
}

byte_vector verification_state::encode() const
{
    byte_writer writer;
    writer.put_u64(total_verifications);
    writer.put_bytes(last_amount);
    writer.put_u64((uint64_t) last_timestamp);
    return writer.buffer;
}

verification_state verification_state::decode(const byte_vector &bytes)
{
    if (bytes.size() != ENCODED_SIZE)
    {
        throw format_error("verification state must be 48 bytes");
    }
    byte_reader reader(bytes);
    verification_state state;
    state.total_verifications = reader.get_u64();
    state.last_amount = reader.get_bytes(32);
    state.last_timestamp = (int64_t) reader.get_u64();
    return state;
}

uint64_t account_ledger::balance_of(const account_id &account) const
{
    const auto it = balances.find(account);
    return it == balances.end() ? 0 : it->second;
}

bool account_ledger::has_record(const account_id &owner, uint64_t index) const
{
    return records.count(record_key(owner, index)) != 0;
}

boost::optional<verification_record> account_ledger::find_record(const account_id &owner, uint64_t index) const
{
    const auto it = records.find(record_key(owner, index));
    if (it == records.end())
    {
        return boost::none;
    }
    return it->second;
}

void account_ledger::commit(const verification_record &record)
{
    if (!record.is_final())
    {
        throw std::logic_error("cannot commit a pending verification record");
    }
    const bool inserted = records.emplace(record_key(record.owner, record.index), record).second;
    if (!inserted)
    {
        throw std::logic_error("verification record already exists");
    }
    if (record.is_accepted())
    {
        state.record_acceptance(record);
    }
}
