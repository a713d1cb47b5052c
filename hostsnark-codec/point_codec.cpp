/** @file
 *****************************************************************************

 Implementation of curve point encodings, see point_codec.hpp

 *****************************************************************************/

#include <algorithm>

#include <libff/common/utils.hpp>

#include "hostsnark-codec/point_codec.hpp"

static bool is_all_zero(const byte_vector &bytes)
{
    return std::all_of(bytes.begin(), bytes.end(), [](unsigned char b) { return b == 0; });
}

byte_vector encode_g1(const libff::alt_bn128_G1 &point, byte_order order)
{
    if (point.is_zero())
    {
        return byte_vector(G1_ENCODED_SIZE, 0);
    }

    libff::alt_bn128_G1 affine(point);
    affine.to_affine_coordinates();

    byte_vector result = encode_field_element(affine.X, order);
    append_bytes(result, encode_field_element(affine.Y, order));
    return result;
}

byte_vector encode_g2(const libff::alt_bn128_G2 &point, byte_order order)
{
    if (point.is_zero())
    {
        return byte_vector(G2_ENCODED_SIZE, 0);
    }

    libff::alt_bn128_G2 affine(point);
    affine.to_affine_coordinates();

    byte_vector result = encode_field_element(affine.X.c1, order);
    append_bytes(result, encode_field_element(affine.X.c0, order));
    append_bytes(result, encode_field_element(affine.Y.c1, order));
    append_bytes(result, encode_field_element(affine.Y.c0, order));
    return result;
}

libff::alt_bn128_G1 decode_g1(const byte_vector &bytes, byte_order order)
{
    if (bytes.size() != G1_ENCODED_SIZE)
    {
        throw format_error(FMT("", "G1 point must be %zu bytes, got %zu", G1_ENCODED_SIZE, bytes.size()));
    }
    if (is_all_zero(bytes))
    {
        return libff::alt_bn128_G1::zero();
    }

    const libff::alt_bn128_Fq x = decode_fq(&bytes[0], order);
    const libff::alt_bn128_Fq y = decode_fq(&bytes[FIELD_ELEMENT_SIZE], order);

    const libff::alt_bn128_G1 point(x, y, libff::alt_bn128_Fq::one());
    if (!point.is_well_formed())
    {
        throw invalid_point_error("G1 point is not on the curve");
    }
    return point;
}

libff::alt_bn128_G2 decode_g2(const byte_vector &bytes, byte_order order)
{
    if (bytes.size() != G2_ENCODED_SIZE)
    {
        throw format_error(FMT("", "G2 point must be %zu bytes, got %zu", G2_ENCODED_SIZE, bytes.size()));
    }
    if (is_all_zero(bytes))
    {
        return libff::alt_bn128_G2::zero();
    }

    const libff::alt_bn128_Fq x_c1 = decode_fq(&bytes[0], order);
    const libff::alt_bn128_Fq x_c0 = decode_fq(&bytes[FIELD_ELEMENT_SIZE], order);
    const libff::alt_bn128_Fq y_c1 = decode_fq(&bytes[2 * FIELD_ELEMENT_SIZE], order);
    const libff::alt_bn128_Fq y_c0 = decode_fq(&bytes[3 * FIELD_ELEMENT_SIZE], order);

    const libff::alt_bn128_G2 point(libff::alt_bn128_Fq2(x_c0, x_c1),
                                    libff::alt_bn128_Fq2(y_c0, y_c1),
                                    libff::alt_bn128_Fq2::one());
    if (!point.is_well_formed())
    {
        throw invalid_point_error("G2 point is not on the twist curve");
    }
    if (!(libff::alt_bn128_modulus_r * point).is_zero())
    {
        throw invalid_point_error("G2 point is not in the prime order subgroup");
    }
    return point;
}

bool is_valid_g1(const libff::alt_bn128_G1 &point)
{
    return point.is_well_formed();
}

bool is_valid_g2(const libff::alt_bn128_G2 &point)
{
    return point.is_well_formed() && (libff::alt_bn128_modulus_r * point).is_zero();
}
