/** @file
 *****************************************************************************

 Implementation of the pairing check primitive over libff.

 *****************************************************************************/

#include <libff/algebra/curves/alt_bn128/alt_bn128_pairing.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include "hostsnark-verifier/pairing_check.hpp"

const char *pairing_status_name(pairing_status status)
{
    switch (status) {
        case pairing_status::ok:
            return "ok";
        case pairing_status::invalid_length:
            return "invalid length";
        case pairing_status::invalid_component:
            return "invalid component";
        case pairing_status::invalid_point:
            return "invalid point";
    }
    return "unknown";
}

byte_vector serialize_pairing_input(const pairing_input &input)
{
    byte_vector flat;
    flat.reserve(input.size() * PAIRING_PAIR_SIZE);
    for (const pairing_pair &pair : input)
    {
        append_bytes(flat, pair.g1);
        append_bytes(flat, pair.g2);
    }
    return flat;
}

pairing_input parse_pairing_input(const byte_vector &flat)
{
    if (flat.size() % PAIRING_PAIR_SIZE != 0)
    {
        throw format_error("pairing input is not a sequence of 192 byte pairs");
    }
    pairing_input input;
    for (size_t offset = 0; offset < flat.size(); offset += PAIRING_PAIR_SIZE)
    {
        input.emplace_back(slice_bytes(flat, offset, G1_ENCODED_SIZE),
                           slice_bytes(flat, offset + G1_ENCODED_SIZE, G2_ENCODED_SIZE));
    }
    return input;
}

pairing_result alt_bn128_pairing_check(const pairing_input &input)
{
    libff::alt_bn128_Fq12 product = libff::alt_bn128_Fq12::one();

    for (const pairing_pair &pair : input)
    {
        if (pair.g1.size() != G1_ENCODED_SIZE || pair.g2.size() != G2_ENCODED_SIZE)
        {
            return pairing_result(pairing_status::invalid_length, false);
        }

        libff::alt_bn128_G1 p;
        libff::alt_bn128_G2 q;
        try
        {
            p = decode_g1(pair.g1, byte_order::big_endian);
            q = decode_g2(pair.g2, byte_order::big_endian);
        }
        catch (const invalid_point_error &)
        {
            return pairing_result(pairing_status::invalid_point, false);
        }
        catch (const format_error &)
        {
            return pairing_result(pairing_status::invalid_component, false);
        }

        // e(0, Q) = e(P, 0) = 1
        if (p.is_zero() || q.is_zero())
        {
            continue;
        }
        product = product * libff::alt_bn128_miller_loop(libff::alt_bn128_precompute_G1(p),
                                                          libff::alt_bn128_precompute_G2(q));
    }

    const libff::alt_bn128_GT result = libff::alt_bn128_final_exponentiation(product);
    return pairing_result(pairing_status::ok, result == libff::alt_bn128_GT::one());
}

pairing_result alt_bn128_pairing_check_bytes(const byte_vector &flat)
{
    if (flat.size() % PAIRING_PAIR_SIZE != 0)
    {
        return pairing_result(pairing_status::invalid_length, false);
    }
    return alt_bn128_pairing_check(parse_pairing_input(flat));
}
