/** @file
 *****************************************************************************

 Declaration of the field element codec.

 Field elements are serialized as 32 byte unsigned integers. The prover side
 (libff, arkworks style tooling) uses little-endian, the execution host and
 its pairing primitive use big-endian. Both encodings are canonical, values
 at or above the modulus are rejected on decode.

 *****************************************************************************/

#ifndef HOSTSNARK_FIELD_CODEC_HPP_
#define HOSTSNARK_FIELD_CODEC_HPP_

#include <libff/algebra/curves/alt_bn128/alt_bn128_init.hpp>
#include <libff/algebra/field_utils/bigint.hpp>

#include "hostsnark-codec/byte_utils.hpp"

const size_t FIELD_ELEMENT_SIZE = 32;

enum class byte_order {
    little_endian, // prover side
    big_endian     // execution host
};

/**
 * Reverse the bytes of every 32 byte element in buffer. The element order is
 * left unchanged, so the conversion is an involution and works for scalars,
 * G1 and G2 encodings alike.
 */
byte_vector convert_endianness(const byte_vector &buffer);

template<mp_size_t n>
byte_vector bigint_to_bytes(const libff::bigint<n> &value, byte_order order);

template<mp_size_t n>
libff::bigint<n> bytes_to_bigint(const unsigned char *bytes, byte_order order);

template<mp_size_t n>
bool bigint_less_than(const libff::bigint<n> &value, const libff::bigint<n> &modulus);

byte_vector encode_field_element(const libff::alt_bn128_Fq &element, byte_order order);
byte_vector encode_field_element(const libff::alt_bn128_Fr &element, byte_order order);

libff::alt_bn128_Fq decode_fq(const unsigned char *bytes, byte_order order);
libff::alt_bn128_Fq decode_fq(const byte_vector &bytes, byte_order order);
libff::alt_bn128_Fr decode_fr(const byte_vector &bytes, byte_order order);

#include "hostsnark-codec/field_codec.tcc"

#endif // HOSTSNARK_FIELD_CODEC_HPP_
