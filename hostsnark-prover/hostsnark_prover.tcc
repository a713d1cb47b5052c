/** @file
 *****************************************************************************

 Implementation of the templated prover, see hostsnark_prover.hpp

 *****************************************************************************/

#ifndef HOSTSNARK_PROVER_TCC_
#define HOSTSNARK_PROVER_TCC_

#include <libff/common/profiling.hpp>
#include <libff/common/utils.hpp>

template<typename ppT>
hostsnark_proof_output<ppT> hostsnark_prover(const hostsnark_proving_key<ppT> &pk,
                                             const hostsnark_primary_input<ppT> &primary_input,
                                             const hostsnark_auxiliary_input<ppT> &auxiliary_input)
{
    const hostsnark_constraint_system<ppT> &cs = pk.constraint_system;
    if (primary_input.size() != cs.primary_input_size)
    {
        throw length_mismatch_error(FMT("", "expected %zu public inputs, got %zu", cs.primary_input_size, primary_input.size()));
    }
    if (primary_input.size() + auxiliary_input.size() != cs.num_variables())
    {
        throw length_mismatch_error(FMT("", "expected %zu variables, got %zu", cs.num_variables(), primary_input.size() + auxiliary_input.size()));
    }
    if (!cs.is_satisfied(primary_input, auxiliary_input))
    {
        throw constraint_unsatisfied_error("witness does not satisfy the constraint system");
    }

    libff::enter_block("Call to hostsnark_prover");

    hostsnark_proof_output<ppT> result;
    result.proof = libsnark::r1cs_gg_ppzksnark_prover<ppT>(pk, primary_input, auxiliary_input);
    result.public_inputs = primary_input;

    libff::leave_block("Call to hostsnark_prover");
    return result;
}

#endif // HOSTSNARK_PROVER_TCC_
