/** @file
 *****************************************************************************

 Tests for the instruction wire format.

 *****************************************************************************/

#include <gtest/gtest.h>

#include "hostsnark-verifier/instruction.hpp"

namespace {

packaged_proof sample_proof(packaging_mode mode, size_t num_inputs, bool with_prepared)
{
    packaged_proof proof;
    proof.mode = mode;
    proof.proof_a = byte_vector(64, 0x11);
    proof.proof_b = byte_vector(128, 0x22);
    proof.proof_c = byte_vector(64, 0x33);
    for (size_t i = 0; i < num_inputs; ++i)
    {
        proof.public_inputs.emplace_back(32, (unsigned char) (0x40 + i));
    }
    if (with_prepared)
    {
        proof.prepared_inputs = byte_vector(64, 0x55);
    }
    return proof;
}

TEST(InstructionTest, VerifyProofLayout)
{
    const packaged_proof proof = sample_proof(packaging_mode::prepared, 2, true);
    const byte_vector data = encode_instruction(verify_proof_instruction(7, proof));

    ASSERT_EQ(1u + 8 + 1 + 256 + 4 + 2 * 32 + 1 + 64, data.size());
    EXPECT_EQ(0, data[0]);
    EXPECT_EQ(7, data[1]);
    EXPECT_EQ(1, data[9]);
    EXPECT_EQ(0x11, data[10]);
    EXPECT_EQ(2, data[10 + 256]);

    const hostsnark_instruction decoded = decode_instruction(data);
    const verify_proof_instruction *instruction = boost::get<verify_proof_instruction>(&decoded);
    ASSERT_NE(nullptr, instruction);
    EXPECT_EQ(7u, instruction->record_index);
    EXPECT_TRUE(instruction->proof == proof);
}

TEST(InstructionTest, VerifyProofWithBalanceCarriesAccount)
{
    const account_id account = make_account_id("alice");
    const packaged_proof proof = sample_proof(packaging_mode::lite, 1, false);
    const byte_vector data = encode_instruction(verify_proof_with_balance_instruction(3, proof, 1000000, account));

    const instruction_envelope envelope = decode_envelope(data);
    EXPECT_EQ(instruction_tag::verify_proof_with_balance, envelope.tag);
    EXPECT_EQ(3u, envelope.record_index);

    const hostsnark_instruction decoded = decode_instruction(envelope);
    const verify_proof_with_balance_instruction *instruction = boost::get<verify_proof_with_balance_instruction>(&decoded);
    ASSERT_NE(nullptr, instruction);
    EXPECT_EQ(1000000u, instruction->balance_threshold);
    EXPECT_EQ(account, instruction->account_to_check);
    EXPECT_TRUE(instruction->proof == proof);
}

TEST(InstructionTest, MalformedEnvelopeIsFormatError)
{
    EXPECT_THROW(decode_envelope(byte_vector()), format_error);
    EXPECT_THROW(decode_envelope(byte_vector(5, 0)), format_error);

    byte_vector data = encode_instruction(verify_proof_instruction(1, sample_proof(packaging_mode::lite, 1, false)));
    data[0] = 2;
    EXPECT_THROW(decode_envelope(data), format_error);
}

TEST(InstructionTest, MalformedBodyIsFormatError)
{
    const byte_vector data = encode_instruction(verify_proof_instruction(1, sample_proof(packaging_mode::standard, 1, false)));

    byte_vector trailing(data);
    trailing.push_back(0);
    EXPECT_THROW(decode_instruction(trailing), format_error);

    const byte_vector truncated(data.begin(), data.end() - 1);
    EXPECT_THROW(decode_instruction(truncated), format_error);

    byte_vector bad_mode(data);
    bad_mode[9] = 3;
    EXPECT_THROW(decode_instruction(bad_mode), format_error);

    byte_vector huge_count(data);
    huge_count[9 + 1 + 256 + 3] = 0xff;
    EXPECT_THROW(decode_instruction(huge_count), format_error);

    byte_vector bad_flag(data);
    bad_flag.back() = 2;
    EXPECT_THROW(decode_instruction(bad_flag), format_error);
}

TEST(InstructionTest, AccountIds)
{
    EXPECT_EQ(make_account_id("bob"), make_account_id("bob"));
    EXPECT_NE(make_account_id("bob"), make_account_id("alice"));
    EXPECT_EQ(std::string("626f62") + std::string(58, '0'), account_id_to_hex(make_account_id("bob")));
    EXPECT_THROW(make_account_id(std::string(33, 'x')), format_error);
}

}
