/** @file
 *****************************************************************************

 Implementation of the compute unit meter, see compute_meter.hpp

 *****************************************************************************/

#include <libff/common/utils.hpp>

#include "hostsnark-verifier/compute_meter.hpp"

void compute_meter::consume(uint64_t units, const std::string &operation)
{
    if (units > budget - consumed)
    {
        const uint64_t left = budget - consumed;
        consumed = budget;
        throw compute_budget_exceeded(FMT("", "%s needs %llu compute units, %llu left",
                                          operation.c_str(),
                                          (unsigned long long) units,
                                          (unsigned long long) left));
    }
    consumed += units;
}
