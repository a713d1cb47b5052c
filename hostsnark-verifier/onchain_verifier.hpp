/** @file
 *****************************************************************************

 Declaration of the on-host Groth16 verifier.

 One call to process handles one instruction and returns its finalized
 record:

   received  -> the instruction body is decoded and its shape is checked
                against the verifying key (format_error otherwise)
   validated -> points are decoded and checked, A is negated and the public
                inputs are accumulated as the packaging mode requires
   accepted / rejected
             -> decided by the pairing primitive over
                [(-A, B), (alpha, beta), (prepared_inputs, gamma), (C, delta)]
                and, for verify_proof_with_balance, the balance predicate

 Every hostsnark_error is turned into a rejected record. Only
 compute_budget_exceeded escapes, the host treats it as an abort.

 *****************************************************************************/

#ifndef HOSTSNARK_ONCHAIN_VERIFIER_HPP_
#define HOSTSNARK_ONCHAIN_VERIFIER_HPP_

#include "hostsnark-verifier/execution_context.hpp"

class onchain_verifier {
private:
    hostsnark_verification_key<hostsnark_pp> vk;

public:
    explicit onchain_verifier(const hostsnark_verification_key<hostsnark_pp> &vk);

    verification_record process(const instruction_envelope &envelope,
                                 const account_id &caller,
                                 execution_context &ctx) const;

    /**
     * Verify a packaged proof. Returns hostsnark_error_code::none and sets
     * prepared_inputs_out on success, the rejection code otherwise.
     */
    hostsnark_error_code verify(const packaged_proof &proof,
                                execution_context &ctx,
                                byte_vector &prepared_inputs_out) const;
};

#endif // HOSTSNARK_ONCHAIN_VERIFIER_HPP_
