/** @file
 *****************************************************************************

 Raw proof and public input encodings, see hostsnark_prover.hpp

 *****************************************************************************/

#include "hostsnark-prover/hostsnark_prover.hpp"

byte_vector encode_raw_proof(const hostsnark_proof<hostsnark_pp> &proof, byte_order order)
{
    byte_vector raw = encode_g1(proof.g_A, order);
    append_bytes(raw, encode_g2(proof.g_B, order));
    append_bytes(raw, encode_g1(proof.g_C, order));
    return raw;
}

hostsnark_proof<hostsnark_pp> decode_raw_proof(const byte_vector &raw, byte_order order)
{
    if (raw.size() != RAW_PROOF_SIZE)
    {
        throw format_error(FMT("", "raw proof must be %zu bytes, got %zu", RAW_PROOF_SIZE, raw.size()));
    }
    hostsnark_proof<hostsnark_pp> proof;
    proof.g_A = decode_g1(slice_bytes(raw, 0, G1_ENCODED_SIZE), order);
    proof.g_B = decode_g2(slice_bytes(raw, G1_ENCODED_SIZE, G2_ENCODED_SIZE), order);
    proof.g_C = decode_g1(slice_bytes(raw, G1_ENCODED_SIZE + G2_ENCODED_SIZE, G1_ENCODED_SIZE), order);
    return proof;
}

std::vector<byte_vector> encode_public_inputs(const hostsnark_primary_input<hostsnark_pp> &inputs, byte_order order)
{
    std::vector<byte_vector> result;
    result.reserve(inputs.size());
    for (const libff::alt_bn128_Fr &input : inputs)
    {
        result.emplace_back(encode_field_element(input, order));
    }
    return result;
}

hostsnark_primary_input<hostsnark_pp> decode_public_inputs(const std::vector<byte_vector> &inputs, byte_order order)
{
    hostsnark_primary_input<hostsnark_pp> result;
    result.reserve(inputs.size());
    for (const byte_vector &input : inputs)
    {
        result.emplace_back(decode_fr(input, order));
    }
    return result;
}
