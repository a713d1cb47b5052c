/** @file
 *****************************************************************************

 Implementation of templated bigint conversions, see field_codec.hpp

 *****************************************************************************/

#ifndef HOSTSNARK_FIELD_CODEC_TCC_
#define HOSTSNARK_FIELD_CODEC_TCC_

#include <gmp.h>

#include "hostsnark-codec/errors.hpp"

template<mp_size_t n>
byte_vector bigint_to_bytes(const libff::bigint<n> &value, byte_order order)
{
    byte_vector result(FIELD_ELEMENT_SIZE, 0);
    for (size_t i = 0; i < FIELD_ELEMENT_SIZE; ++i)
    {
        // i counts bytes from the least significant end
        const size_t limb = i / sizeof(mp_limb_t);
        const size_t shift = 8 * (i % sizeof(mp_limb_t));
        const unsigned char b = (limb < (size_t) n) ? (unsigned char) (value.data[limb] >> shift) : 0;

        if (order == byte_order::little_endian)
        {
            result[i] = b;
        }
        else
        {
            result[FIELD_ELEMENT_SIZE - 1 - i] = b;
        }
    }
    return result;
}

template<mp_size_t n>
libff::bigint<n> bytes_to_bigint(const unsigned char *bytes, byte_order order)
{
    libff::bigint<n> result;
    result.clear();
    for (size_t i = 0; i < FIELD_ELEMENT_SIZE; ++i)
    {
        const unsigned char b = (order == byte_order::little_endian) ? bytes[i] : bytes[FIELD_ELEMENT_SIZE - 1 - i];
        const size_t limb = i / sizeof(mp_limb_t);
        if (limb >= (size_t) n)
        {
            if (b != 0)
            {
                throw format_error("integer does not fit the limb representation");
            }
            continue;
        }
        result.data[limb] |= ((mp_limb_t) b) << (8 * (i % sizeof(mp_limb_t)));
    }
    return result;
}

template<mp_size_t n>
bool bigint_less_than(const libff::bigint<n> &value, const libff::bigint<n> &modulus)
{
    return mpn_cmp(value.data, modulus.data, n) < 0;
}

#endif // HOSTSNARK_FIELD_CODEC_TCC_
