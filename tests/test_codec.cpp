/** @file
 *****************************************************************************

 Tests for field element and curve point encodings.

 *****************************************************************************/

#include <gtest/gtest.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include "hostsnark-codec/point_codec.hpp"

namespace {

byte_vector counting_bytes(size_t n)
{
    byte_vector result(n);
    for (size_t i = 0; i < n; ++i)
    {
        result[i] = (unsigned char) (i * 7 + 3);
    }
    return result;
}

TEST(FieldCodecTest, ConvertEndiannessIsAnInvolution)
{
    const byte_vector buffer = counting_bytes(96);
    const byte_vector converted = convert_endianness(buffer);

    EXPECT_NE(buffer, converted);
    EXPECT_EQ(buffer, convert_endianness(converted));
    // elements keep their position, only their bytes are reversed
    EXPECT_EQ(buffer[31], converted[0]);
    EXPECT_EQ(buffer[32], converted[63]);
}

TEST(FieldCodecTest, ConvertEndiannessEmptyBuffer)
{
    EXPECT_TRUE(convert_endianness(byte_vector()).empty());
}

TEST(FieldCodecTest, ConvertEndiannessRejectsPartialElement)
{
    EXPECT_THROW(convert_endianness(byte_vector(33, 1)), format_error);
    EXPECT_THROW(convert_endianness(byte_vector(31, 1)), format_error);
}

TEST(FieldCodecTest, ZeroEncodesToZeroBytes)
{
    const byte_vector zero(32, 0);
    EXPECT_EQ(zero, encode_field_element(libff::alt_bn128_Fr::zero(), byte_order::little_endian));
    EXPECT_EQ(zero, encode_field_element(libff::alt_bn128_Fr::zero(), byte_order::big_endian));
    EXPECT_EQ(libff::alt_bn128_Fr::zero(), decode_fr(zero, byte_order::big_endian));
}

TEST(FieldCodecTest, OneHasTheExpectedByteOrder)
{
    const byte_vector le = encode_field_element(libff::alt_bn128_Fr::one(), byte_order::little_endian);
    const byte_vector be = encode_field_element(libff::alt_bn128_Fr::one(), byte_order::big_endian);

    EXPECT_EQ(1, le[0]);
    EXPECT_EQ(1, be[31]);
    EXPECT_EQ(be, convert_endianness(le));
}

TEST(FieldCodecTest, LargestElementRoundTrips)
{
    const libff::alt_bn128_Fq q_minus_one = -libff::alt_bn128_Fq::one();
    const libff::alt_bn128_Fr r_minus_one = -libff::alt_bn128_Fr::one();

    for (byte_order order : {byte_order::little_endian, byte_order::big_endian})
    {
        EXPECT_EQ(q_minus_one, decode_fq(encode_field_element(q_minus_one, order), order));
        EXPECT_EQ(r_minus_one, decode_fr(encode_field_element(r_minus_one, order), order));
    }
}

TEST(FieldCodecTest, ModulusIsRejected)
{
    const byte_vector q = bigint_to_bytes<libff::alt_bn128_q_limbs>(libff::alt_bn128_modulus_q, byte_order::big_endian);
    const byte_vector r = bigint_to_bytes<libff::alt_bn128_r_limbs>(libff::alt_bn128_modulus_r, byte_order::little_endian);

    EXPECT_THROW(decode_fq(q, byte_order::big_endian), format_error);
    EXPECT_THROW(decode_fr(r, byte_order::little_endian), format_error);
    EXPECT_THROW(decode_fr(byte_vector(32, 0xff), byte_order::big_endian), format_error);
}

TEST(FieldCodecTest, WrongWidthIsRejected)
{
    EXPECT_THROW(decode_fr(byte_vector(31, 0), byte_order::big_endian), format_error);
    EXPECT_THROW(decode_fq(byte_vector(33, 0), byte_order::big_endian), format_error);
}

TEST(FieldCodecTest, HexFormatting)
{
    const byte_vector bytes = {0x00, 0x1f, 0xa0, 0xff};
    EXPECT_EQ("001fa0ff", bytes_to_hex(bytes));
    EXPECT_EQ(bytes, hex_to_bytes("001FA0ff"));
    EXPECT_THROW(hex_to_bytes("abc"), format_error);
    EXPECT_THROW(hex_to_bytes("zz"), format_error);
}

TEST(PointCodecTest, G1GeneratorRoundTrips)
{
    const libff::alt_bn128_G1 g = libff::alt_bn128_G1::one();
    const libff::alt_bn128_G1 p = libff::alt_bn128_Fr(12345) * g;

    for (byte_order order : {byte_order::little_endian, byte_order::big_endian})
    {
        EXPECT_EQ(g, decode_g1(encode_g1(g, order), order));
        EXPECT_EQ(p, decode_g1(encode_g1(p, order), order));
    }
    EXPECT_EQ(encode_g1(p, byte_order::big_endian), convert_endianness(encode_g1(p, byte_order::little_endian)));

    // the generator is (1, 2)
    const byte_vector be = encode_g1(g, byte_order::big_endian);
    EXPECT_EQ(1, be[31]);
    EXPECT_EQ(2, be[63]);
}

TEST(PointCodecTest, InfinityIsAllZero)
{
    EXPECT_EQ(byte_vector(64, 0), encode_g1(libff::alt_bn128_G1::zero(), byte_order::big_endian));
    EXPECT_EQ(byte_vector(128, 0), encode_g2(libff::alt_bn128_G2::zero(), byte_order::big_endian));
    EXPECT_TRUE(decode_g1(byte_vector(64, 0), byte_order::big_endian).is_zero());
    EXPECT_TRUE(decode_g2(byte_vector(128, 0), byte_order::little_endian).is_zero());
}

TEST(PointCodecTest, G1OffCurveIsInvalidPoint)
{
    byte_vector bytes = encode_g1(libff::alt_bn128_G1::one(), byte_order::big_endian);
    bytes[63] = 3; // (1, 3)
    EXPECT_THROW(decode_g1(bytes, byte_order::big_endian), invalid_point_error);
}

TEST(PointCodecTest, G1NonCanonicalCoordinateIsFormatError)
{
    byte_vector bytes(64, 0xff);
    EXPECT_THROW(decode_g1(bytes, byte_order::big_endian), format_error);
    EXPECT_THROW(decode_g1(byte_vector(63, 0), byte_order::big_endian), format_error);
}

TEST(PointCodecTest, G2ImaginaryPartComesFirst)
{
    libff::alt_bn128_G2 g = libff::alt_bn128_G2::one();
    g.to_affine_coordinates();

    for (byte_order order : {byte_order::little_endian, byte_order::big_endian})
    {
        const byte_vector bytes = encode_g2(g, order);
        EXPECT_EQ(encode_field_element(g.X.c1, order), slice_bytes(bytes, 0, 32));
        EXPECT_EQ(encode_field_element(g.X.c0, order), slice_bytes(bytes, 32, 32));
        EXPECT_EQ(encode_field_element(g.Y.c1, order), slice_bytes(bytes, 64, 32));
        EXPECT_EQ(encode_field_element(g.Y.c0, order), slice_bytes(bytes, 96, 32));
        EXPECT_EQ(g, decode_g2(bytes, order));
    }
    EXPECT_EQ(encode_g2(g, byte_order::big_endian), convert_endianness(encode_g2(g, byte_order::little_endian)));
}

TEST(PointCodecTest, G2OutsideSubgroupIsInvalidPoint)
{
    // find a point on the twist with a small x; the cofactor makes it land
    // outside the order r subgroup
    libff::alt_bn128_G2 point;
    bool found = false;
    for (long i = 1; i < 100 && !found; ++i)
    {
        const libff::alt_bn128_Fq2 x(libff::alt_bn128_Fq(i), libff::alt_bn128_Fq::zero());
        const libff::alt_bn128_Fq2 rhs = x.squared() * x + libff::alt_bn128_twist_coeff_b;
        if ((rhs ^ libff::alt_bn128_Fq2::euler) == libff::alt_bn128_Fq2::one())
        {
            point = libff::alt_bn128_G2(x, rhs.sqrt(), libff::alt_bn128_Fq2::one());
            found = true;
        }
    }
    ASSERT_TRUE(found);
    ASSERT_TRUE(point.is_well_formed());
    EXPECT_FALSE(is_valid_g2(point));
    EXPECT_THROW(decode_g2(encode_g2(point, byte_order::big_endian), byte_order::big_endian), invalid_point_error);
}

TEST(PointCodecTest, G2OffCurveIsInvalidPoint)
{
    byte_vector bytes = encode_g2(libff::alt_bn128_G2::one(), byte_order::big_endian);
    bytes[127] ^= 1;
    EXPECT_THROW(decode_g2(bytes, byte_order::big_endian), invalid_point_error);
    EXPECT_THROW(decode_g2(byte_vector(127, 0), byte_order::big_endian), format_error);
}

}
