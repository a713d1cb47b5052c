/** @file
 *****************************************************************************

 Implementation of the execution host, see execution_host.hpp

 *****************************************************************************/

#include <iostream>

#include <libff/common/profiling.hpp>

#include "hostsnark-codec/profiling_block.hpp"
#include "hostsnark-verifier/execution_host.hpp"

execution_host::execution_host(const onchain_verifier &verifier,
                               const verifier_config &config,
                               const pairing_check_fn &pairing_check) :
    verifier(verifier), config(config), pairing_check(pairing_check), clock(0)
{
}

execution_result execution_host::execute(const account_id &caller, const byte_vector &instruction_data)
{
    const profiling_block block("Call to execution_host::execute");

    execution_result result;
    compute_meter meter(config.compute_budget);
    std::vector<std::string> invocation_log;

    try
    {
        const instruction_envelope envelope = decode_envelope(instruction_data);
        if (ledger.has_record(caller, envelope.record_index))
        {
            result.abort_reason = "record " + std::to_string(envelope.record_index) + " already exists";
        }
        else
        {
            execution_context ctx(meter, config, pairing_check, ledger, clock, invocation_log);
            const verification_record record = verifier.process(envelope, caller, ctx);

            ledger.commit(record);
            result.status = execution_status::committed;
            result.record = record;
        }
    }
    catch (const compute_budget_exceeded &e)
    {
        result.abort_reason = e.what();
    }
    catch (const format_error &e)
    {
        result.abort_reason = std::string("malformed instruction envelope: ") + e.what();
    }

    if (!result.committed())
    {
        invocation_log.emplace_back("aborted: " + result.abort_reason);
        std::cerr << "Transaction aborted: " << result.abort_reason << std::endl;
    }
    result.compute_units = meter.units_consumed();
    invocation_log.emplace_back("consumed " + std::to_string(result.compute_units) + " compute units");

    if (!libff::inhibit_profiling_info)
    {
        for (const std::string &line : invocation_log)
        {
            libff::print_indent(); std::cout << "Program log: " << line << std::endl;
        }
    }
    program_log.insert(program_log.end(), invocation_log.begin(), invocation_log.end());

    return result;
}

void execution_host::set_balance(const account_id &account, uint64_t balance)
{
    ledger.balances[account] = balance;
}

void execution_host::advance_clock(int64_t seconds)
{
    clock += seconds;
}

boost::optional<verification_record> execution_host::find_record(const account_id &owner, uint64_t index) const
{
    return ledger.find_record(owner, index);
}
