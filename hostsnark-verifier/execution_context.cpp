/** @file
 *****************************************************************************

 Implementation of the per invocation context, see execution_context.hpp

 *****************************************************************************/

#include "hostsnark-verifier/execution_context.hpp"

void execution_context::charge(uint64_t units, const std::string &operation)
{
    meter.consume(units, operation);
}

pairing_result execution_context::alt_bn128_pairing(const pairing_input &input)
{
    meter.consume(host_config.pairing_cost(input.size()), "alt_bn128_pairing");
    return pairing_check(input);
}

uint64_t execution_context::balance_of(const account_id &account) const
{
    return ledger.balance_of(account);
}

void execution_context::msg(const std::string &line)
{
    program_log.emplace_back(line);
}
