/** @file
 *****************************************************************************

 Shared setup for tests that need real keys and proofs: one keypair for the
 threshold circuit, and helpers to prove, package and wrap proofs into
 instructions.

 *****************************************************************************/

#ifndef HOSTSNARK_TEST_THRESHOLD_FIXTURE_HPP_
#define HOSTSNARK_TEST_THRESHOLD_FIXTURE_HPP_

#include "application/gadgets/threshold_gadget.hpp"
#include "hostsnark-verifier/execution_host.hpp"

typedef libff::Fr<hostsnark_pp> FieldT;

class threshold_fixture {
public:
    const bool disclose_value;
    hostsnark_keypair<hostsnark_pp> keypair;

    explicit threshold_fixture(bool disclose_value=false) : disclose_value(disclose_value)
    {
        threshold_circuit<FieldT> circuit(disclose_value);
        keypair = hostsnark_generator<hostsnark_pp>(circuit.get_constraint_system());
    }

    hostsnark_proof_output<hostsnark_pp> prove(unsigned long value, unsigned long threshold) const
    {
        threshold_circuit<FieldT> circuit(disclose_value);
        circuit.generate_r1cs_witness(value, threshold);
        return hostsnark_prover<hostsnark_pp>(keypair.pk, circuit.primary_input(), circuit.auxiliary_input());
    }

    packaged_proof package(unsigned long value, unsigned long threshold, packaging_mode mode) const
    {
        const hostsnark_proof_output<hostsnark_pp> output = prove(value, threshold);
        return package_proof(encode_raw_proof(output.proof), encode_public_inputs(output.public_inputs), keypair.vk, mode);
    }

    byte_vector instruction(uint64_t index, const packaged_proof &proof) const
    {
        return encode_instruction(verify_proof_instruction(index, proof));
    }

    byte_vector instruction_with_balance(uint64_t index, const packaged_proof &proof,
                                         uint64_t required, const account_id &account) const
    {
        return encode_instruction(verify_proof_with_balance_instruction(index, proof, required, account));
    }

    execution_host make_host(const verifier_config &config=verifier_config(),
                             const pairing_check_fn &pairing_check=alt_bn128_pairing_check) const
    {
        return execution_host(onchain_verifier(keypair.vk), config, pairing_check);
    }
};

#endif // HOSTSNARK_TEST_THRESHOLD_FIXTURE_HPP_
