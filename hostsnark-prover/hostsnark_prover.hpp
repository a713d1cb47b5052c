/** @file
 *****************************************************************************

 Declaration of the proof builder.

 hostsnark_prover checks the assignment against the constraint system before
 handing it to libsnark's Groth16 prover, so a bad witness is reported as
 constraint_unsatisfied_error instead of producing a proof that will never
 verify.

 Raw proofs use the prover side encoding (little-endian):
 A (G1, 64) || B (G2, 128) || C (G1, 64) = 256 bytes.

 *****************************************************************************/

#ifndef HOSTSNARK_PROVER_HPP_
#define HOSTSNARK_PROVER_HPP_

#include "hostsnark-prover/hostsnark_keys.hpp"

const size_t RAW_PROOF_SIZE = 2 * G1_ENCODED_SIZE + G2_ENCODED_SIZE;

template<typename ppT>
using hostsnark_proof = libsnark::r1cs_gg_ppzksnark_proof<ppT>;

template<typename ppT>
class hostsnark_proof_output {
public:
    hostsnark_proof<ppT> proof;
    hostsnark_primary_input<ppT> public_inputs;
};

template<typename ppT>
hostsnark_proof_output<ppT> hostsnark_prover(const hostsnark_proving_key<ppT> &pk,
                                             const hostsnark_primary_input<ppT> &primary_input,
                                             const hostsnark_auxiliary_input<ppT> &auxiliary_input);

byte_vector encode_raw_proof(const hostsnark_proof<hostsnark_pp> &proof, byte_order order=byte_order::little_endian);
hostsnark_proof<hostsnark_pp> decode_raw_proof(const byte_vector &raw, byte_order order=byte_order::little_endian);

std::vector<byte_vector> encode_public_inputs(const hostsnark_primary_input<hostsnark_pp> &inputs, byte_order order=byte_order::little_endian);
hostsnark_primary_input<hostsnark_pp> decode_public_inputs(const std::vector<byte_vector> &inputs, byte_order order=byte_order::little_endian);

#include "hostsnark-prover/hostsnark_prover.tcc"

#endif // HOSTSNARK_PROVER_HPP_
