/** @file
 *****************************************************************************

 Declaration of curve point encodings for BN254 (alt_bn128).

 G1: x || y, 64 bytes.
 G2: x.c1 || x.c0 || y.c1 || y.c0, 128 bytes (imaginary part first, the
     order the pairing precompile expects). The same component order is used
     for both byte orders, so convert_endianness maps one encoding onto the
     other.
 The point at infinity is the all-zero encoding.

 Decoding validates: coordinates must be canonical field elements
 (format_error), the point must lie on the curve and G2 points must lie in
 the order r subgroup (invalid_point_error).

 *****************************************************************************/

#ifndef HOSTSNARK_POINT_CODEC_HPP_
#define HOSTSNARK_POINT_CODEC_HPP_

#include <libff/algebra/curves/alt_bn128/alt_bn128_g1.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_g2.hpp>

#include "hostsnark-codec/field_codec.hpp"

const size_t G1_ENCODED_SIZE = 2 * FIELD_ELEMENT_SIZE;
const size_t G2_ENCODED_SIZE = 4 * FIELD_ELEMENT_SIZE;

byte_vector encode_g1(const libff::alt_bn128_G1 &point, byte_order order);
byte_vector encode_g2(const libff::alt_bn128_G2 &point, byte_order order);

libff::alt_bn128_G1 decode_g1(const byte_vector &bytes, byte_order order);
libff::alt_bn128_G2 decode_g2(const byte_vector &bytes, byte_order order);

bool is_valid_g1(const libff::alt_bn128_G1 &point);
bool is_valid_g2(const libff::alt_bn128_G2 &point);

#endif // HOSTSNARK_POINT_CODEC_HPP_
