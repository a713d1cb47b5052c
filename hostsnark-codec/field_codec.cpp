/** @file
 *****************************************************************************

 Implementation of the field element codec, see field_codec.hpp

 *****************************************************************************/

#include <algorithm>

#include <libff/common/utils.hpp>

#include "hostsnark-codec/field_codec.hpp"

byte_vector convert_endianness(const byte_vector &buffer)
{
    if (buffer.size() % FIELD_ELEMENT_SIZE != 0)
    {
        throw format_error(FMT("", "buffer of %zu bytes is not a sequence of %zu byte elements", buffer.size(), FIELD_ELEMENT_SIZE));
    }

    byte_vector result(buffer);
    for (size_t offset = 0; offset < result.size(); offset += FIELD_ELEMENT_SIZE)
    {
        std::reverse(result.begin() + offset, result.begin() + offset + FIELD_ELEMENT_SIZE);
    }
    return result;
}

byte_vector encode_field_element(const libff::alt_bn128_Fq &element, byte_order order)
{
    return bigint_to_bytes<libff::alt_bn128_q_limbs>(element.as_bigint(), order);
}

byte_vector encode_field_element(const libff::alt_bn128_Fr &element, byte_order order)
{
    return bigint_to_bytes<libff::alt_bn128_r_limbs>(element.as_bigint(), order);
}

libff::alt_bn128_Fq decode_fq(const unsigned char *bytes, byte_order order)
{
    const libff::bigint<libff::alt_bn128_q_limbs> value = bytes_to_bigint<libff::alt_bn128_q_limbs>(bytes, order);
    if (!bigint_less_than<libff::alt_bn128_q_limbs>(value, libff::alt_bn128_modulus_q))
    {
        throw format_error("base field element is not reduced modulo q");
    }
    return libff::alt_bn128_Fq(value);
}

libff::alt_bn128_Fq decode_fq(const byte_vector &bytes, byte_order order)
{
    if (bytes.size() != FIELD_ELEMENT_SIZE)
    {
        throw format_error(FMT("", "base field element must be %zu bytes, got %zu", FIELD_ELEMENT_SIZE, bytes.size()));
    }
    return decode_fq(bytes.data(), order);
}

libff::alt_bn128_Fr decode_fr(const byte_vector &bytes, byte_order order)
{
    if (bytes.size() != FIELD_ELEMENT_SIZE)
    {
        throw format_error(FMT("", "scalar must be %zu bytes, got %zu", FIELD_ELEMENT_SIZE, bytes.size()));
    }
    const libff::bigint<libff::alt_bn128_r_limbs> value = bytes_to_bigint<libff::alt_bn128_r_limbs>(bytes.data(), order);
    if (!bigint_less_than<libff::alt_bn128_r_limbs>(value, libff::alt_bn128_modulus_r))
    {
        throw format_error("scalar is not reduced modulo r");
    }
    return libff::alt_bn128_Fr(value);
}
