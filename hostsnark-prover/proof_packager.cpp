/** @file
 *****************************************************************************

 Implementation of proof packaging, see proof_packager.hpp

 *****************************************************************************/

#include <iostream>

#include <libff/common/profiling.hpp>

#include "hostsnark-codec/profiling_block.hpp"
#include "hostsnark-prover/proof_packager.hpp"

const char *packaging_mode_name(packaging_mode mode)
{
    switch (mode) {
        case packaging_mode::lite:
            return "lite";
        case packaging_mode::prepared:
            return "prepared";
        case packaging_mode::standard:
            return "standard";
    }
    return "unknown";
}

packaging_mode parse_packaging_mode(const std::string &name)
{
    if (name == "lite") return packaging_mode::lite;
    if (name == "prepared") return packaging_mode::prepared;
    if (name == "standard") return packaging_mode::standard;
    throw format_error("unknown packaging mode: " + name);
}

std::ostream& operator<<(std::ostream &out, packaging_mode mode)
{
    out << packaging_mode_name(mode);
    return out;
}

byte_vector packaged_proof::proof_bytes() const
{
    byte_vector result(proof_a);
    append_bytes(result, proof_b);
    append_bytes(result, proof_c);
    return result;
}

bool packaged_proof::operator==(const packaged_proof &other) const
{
    return (this->mode == other.mode &&
            this->proof_a == other.proof_a &&
            this->proof_b == other.proof_b &&
            this->proof_c == other.proof_c &&
            this->public_inputs == other.public_inputs &&
            this->prepared_inputs == other.prepared_inputs);
}

libff::alt_bn128_G1 negate_a(const libff::alt_bn128_G1 &point)
{
    if (!is_valid_g1(point))
    {
        throw invalid_point_error("cannot negate a point that is not on the curve");
    }
    return -point;
}

byte_vector negate_g1(const byte_vector &point, byte_order order)
{
    return encode_g1(negate_a(decode_g1(point, order)), order);
}

byte_vector prepare_inputs(const hostsnark_verification_key<hostsnark_pp> &vk,
                           const std::vector<byte_vector> &public_inputs,
                           byte_order order)
{
    return encode_g1(prepare_inputs<hostsnark_pp>(vk, decode_public_inputs(public_inputs, order)), order);
}

packaged_proof package_proof(const byte_vector &raw_proof,
                             const std::vector<byte_vector> &raw_public_inputs,
                             const hostsnark_verification_key<hostsnark_pp> &vk,
                             packaging_mode mode)
{
    if (raw_proof.size() != RAW_PROOF_SIZE)
    {
        throw format_error(FMT("", "raw proof must be %zu bytes, got %zu", RAW_PROOF_SIZE, raw_proof.size()));
    }
    if (raw_public_inputs.size() != vk.num_public_inputs())
    {
        throw length_mismatch_error(FMT("", "verifying key expects %zu public inputs, got %zu", vk.num_public_inputs(), raw_public_inputs.size()));
    }

    const profiling_block block("Call to package_proof");

    // element-wise byte reversal keeps the G2 component order intact
    const byte_vector host_proof = convert_endianness(raw_proof);

    packaged_proof result;
    result.mode = mode;
    result.proof_a = slice_bytes(host_proof, 0, G1_ENCODED_SIZE);
    result.proof_b = slice_bytes(host_proof, G1_ENCODED_SIZE, G2_ENCODED_SIZE);
    result.proof_c = slice_bytes(host_proof, G1_ENCODED_SIZE + G2_ENCODED_SIZE, G1_ENCODED_SIZE);

    for (const byte_vector &input : raw_public_inputs)
    {
        if (input.size() != FIELD_ELEMENT_SIZE)
        {
            throw format_error(FMT("", "public input must be %zu bytes, got %zu", FIELD_ELEMENT_SIZE, input.size()));
        }
        result.public_inputs.emplace_back(convert_endianness(input));
    }

    if (mode != packaging_mode::lite)
    {
        result.proof_a = negate_g1(result.proof_a, byte_order::big_endian);
    }
    else
    {
        // validate anyway, lite only defers the arithmetic
        decode_g1(result.proof_a, byte_order::big_endian);
    }
    decode_g2(result.proof_b, byte_order::big_endian);
    decode_g1(result.proof_c, byte_order::big_endian);

    if (mode == packaging_mode::prepared)
    {
        result.prepared_inputs = prepare_inputs(vk, result.public_inputs, byte_order::big_endian);
    }
    else
    {
        // scalars are checked here so that a bad input fails off-host
        decode_public_inputs(result.public_inputs, byte_order::big_endian);
    }

    return result;
}

void check_packaged_shape(const hostsnark_verification_key<hostsnark_pp> &vk, const packaged_proof &proof)
{
    if (proof.proof_a.size() != G1_ENCODED_SIZE ||
        proof.proof_b.size() != G2_ENCODED_SIZE ||
        proof.proof_c.size() != G1_ENCODED_SIZE)
    {
        throw format_error("proof component has the wrong width");
    }
    if (proof.public_inputs.size() != vk.num_public_inputs())
    {
        throw format_error(FMT("", "verifying key expects %zu public inputs, proof carries %zu",
                               vk.num_public_inputs(), proof.public_inputs.size()));
    }
    if (proof.mode == packaging_mode::prepared && !proof.prepared_inputs)
    {
        throw format_error("prepared proof without prepared inputs");
    }
    if (proof.mode != packaging_mode::prepared && proof.prepared_inputs)
    {
        throw format_error(FMT("", "%s proof must not carry prepared inputs", packaging_mode_name(proof.mode)));
    }
    if (proof.prepared_inputs && proof.prepared_inputs->size() != G1_ENCODED_SIZE)
    {
        throw format_error("prepared inputs have the wrong width");
    }
}

pairing_input groth16_pairing_input(const hostsnark_verification_key<hostsnark_pp> &vk,
                                    const byte_vector &negated_a,
                                    const byte_vector &b,
                                    const byte_vector &prepared_inputs,
                                    const byte_vector &c)
{
    pairing_input input;
    input.emplace_back(negated_a, b);
    input.emplace_back(encode_g1(vk.alpha_g1, byte_order::big_endian), encode_g2(vk.beta_g2, byte_order::big_endian));
    input.emplace_back(prepared_inputs, encode_g2(vk.gamma_g2, byte_order::big_endian));
    input.emplace_back(c, encode_g2(vk.delta_g2, byte_order::big_endian));
    return input;
}

hostsnark_error_code verify_packaged_proof(const hostsnark_verification_key<hostsnark_pp> &vk,
                                           const packaged_proof &proof,
                                           const pairing_check_fn &pairing_check)
{
    const profiling_block block("Call to verify_packaged_proof");
    try
    {
        check_packaged_shape(vk, proof);

        const libff::alt_bn128_G1 a = decode_g1(proof.proof_a, byte_order::big_endian);
        decode_g2(proof.proof_b, byte_order::big_endian);
        decode_g1(proof.proof_c, byte_order::big_endian);

        const byte_vector negated_a = (proof.mode == packaging_mode::lite) ?
            encode_g1(negate_a(a), byte_order::big_endian) : proof.proof_a;
        const byte_vector prepared = prepare_inputs(vk, proof.public_inputs, byte_order::big_endian);

        if (proof.mode == packaging_mode::prepared &&
            !(decode_g1(*proof.prepared_inputs, byte_order::big_endian) == decode_g1(prepared, byte_order::big_endian)))
        {
            return hostsnark_error_code::prepared_inputs_mismatch;
        }

        const pairing_result result = pairing_check(groth16_pairing_input(vk, negated_a, proof.proof_b, prepared, proof.proof_c));
        if (!result.ok())
        {
            return hostsnark_error_code::pairing_input_error;
        }
        return result.is_identity ? hostsnark_error_code::none : hostsnark_error_code::pairing_failed;
    }
    catch (const hostsnark_error &e)
    {
        if (!libff::inhibit_profiling_info)
        {
            libff::print_indent(); std::cout << "packaged proof rejected: " << e.what() << std::endl;
        }
        return e.code();
    }
}
