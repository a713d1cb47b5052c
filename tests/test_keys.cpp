/** @file
 *****************************************************************************

 Tests for key generation, the verifying key blob and key files.

 *****************************************************************************/

#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>

#include "threshold_fixture.hpp"

namespace {

class KeysTest : public ::testing::Test {
protected:
    static threshold_fixture *fixture;
    std::vector<std::string> created;

    static void SetUpTestCase()
    {
        fixture = new threshold_fixture(true);
    }

    static void TearDownTestCase()
    {
        delete fixture;
        fixture = nullptr;
    }

    void TearDown() override
    {
        for (const std::string &path : created)
        {
            std::remove(path.c_str());
            std::remove((path + ".lock").c_str());
        }
    }

    std::string temp_path(const std::string &name)
    {
        const std::string path = ::testing::TempDir() + "hostsnark_" + name;
        created.push_back(path);
        return path;
    }
};

threshold_fixture *KeysTest::fixture = nullptr;

TEST_F(KeysTest, GeneratorShapesVerifyingKey)
{
    const hostsnark_verification_key<hostsnark_pp> &vk = fixture->keypair.vk;
    EXPECT_EQ(2u, vk.num_public_inputs());
    EXPECT_EQ(3u, vk.gamma_abc_g1.size());
    EXPECT_TRUE(is_valid_g1(vk.alpha_g1));
    EXPECT_TRUE(is_valid_g2(vk.beta_g2));
    EXPECT_TRUE(is_valid_g2(vk.gamma_g2));
    EXPECT_TRUE(is_valid_g2(vk.delta_g2));
}

TEST_F(KeysTest, VerifyingKeyBlobLayout)
{
    const hostsnark_verification_key<hostsnark_pp> &vk = fixture->keypair.vk;
    const byte_vector blob = encode_verification_key(vk);

    ASSERT_EQ(64u + 3 * 128 + 4 + 3 * 64, blob.size());
    EXPECT_EQ(encode_g1(vk.alpha_g1, byte_order::big_endian), slice_bytes(blob, 0, 64));
    EXPECT_EQ(encode_g2(vk.delta_g2, byte_order::big_endian), slice_bytes(blob, 64 + 2 * 128, 128));
    EXPECT_EQ(3, blob[64 + 3 * 128]);
    EXPECT_EQ(encode_g1(vk.gamma_abc_g1[2], byte_order::big_endian), slice_bytes(blob, blob.size() - 64, 64));

    EXPECT_TRUE(decode_verification_key(blob) == vk);
}

TEST_F(KeysTest, MalformedVerifyingKeyBlob)
{
    const byte_vector blob = encode_verification_key(fixture->keypair.vk);
    const size_t count_offset = 64 + 3 * 128;

    EXPECT_THROW(decode_verification_key(byte_vector(blob.begin(), blob.begin() + 100)), format_error);
    EXPECT_THROW(decode_verification_key(byte_vector(blob.begin(), blob.end() - 1)), format_error);

    byte_vector extra(blob);
    extra.push_back(0);
    EXPECT_THROW(decode_verification_key(extra), format_error);

    byte_vector wrong_count(blob);
    wrong_count[count_offset] = 4;
    EXPECT_THROW(decode_verification_key(wrong_count), format_error);

    byte_vector no_points(blob.begin(), blob.begin() + count_offset + 4);
    no_points[count_offset] = 0;
    EXPECT_THROW(decode_verification_key(no_points), format_error);

    byte_vector bad_beta(blob);
    bad_beta[64 + 127] ^= 1;
    EXPECT_THROW(decode_verification_key(bad_beta), invalid_point_error);
}

TEST_F(KeysTest, KeysSurviveFiles)
{
    const std::string pk_path = temp_path("threshold.pk");
    const std::string vk_path = temp_path("threshold.vk");

    store_proving_key(pk_path, fixture->keypair.pk);
    store_verification_key(vk_path, fixture->keypair.vk);

    const hostsnark_verification_key<hostsnark_pp> vk = load_verification_key(vk_path);
    EXPECT_TRUE(vk == fixture->keypair.vk);

    const hostsnark_proving_key<hostsnark_pp> pk = load_proving_key(pk_path);
    EXPECT_TRUE(pk == fixture->keypair.pk);

    threshold_circuit<FieldT> circuit(true);
    circuit.generate_r1cs_witness(42, 18);
    const hostsnark_proof_output<hostsnark_pp> output =
        hostsnark_prover<hostsnark_pp>(pk, circuit.primary_input(), circuit.auxiliary_input());

    execution_host host(onchain_verifier(vk), verifier_config());
    const packaged_proof proof = package_proof(encode_raw_proof(output.proof), encode_public_inputs(output.public_inputs),
                                               vk, packaging_mode::standard);
    const execution_result result = host.execute(make_account_id("prover"), fixture->instruction(0, proof));
    ASSERT_TRUE(result.committed());
    EXPECT_TRUE(result.record->is_accepted());
}

TEST_F(KeysTest, MissingOrBrokenKeyFiles)
{
    EXPECT_THROW(load_verification_key(temp_path("does_not_exist.vk")), std::runtime_error);
    EXPECT_THROW(deserialize_proving_key(byte_vector()), format_error);

    const std::string vk_path = temp_path("short.vk");
    const byte_vector blob = encode_verification_key(fixture->keypair.vk);
    {
        std::ofstream out(vk_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(blob.data()), blob.size() - 10);
    }
    EXPECT_THROW(load_verification_key(vk_path), format_error);

    EXPECT_THROW(load_proving_key(temp_path("does_not_exist.pk")), std::runtime_error);
}

TEST_F(KeysTest, LoadingMissingKeyLeavesNoLockFile)
{
    const std::string vk_path = temp_path("absent.vk");
    const std::string pk_path = temp_path("absent.pk");
    EXPECT_THROW(load_verification_key(vk_path), std::runtime_error);
    EXPECT_THROW(load_proving_key(pk_path), std::runtime_error);
    EXPECT_FALSE(std::ifstream(vk_path + ".lock"));
    EXPECT_FALSE(std::ifstream(pk_path + ".lock"));

    store_verification_key(vk_path, fixture->keypair.vk);
    EXPECT_TRUE(std::ifstream(vk_path + ".lock"));
}

TEST(KeyGenerationTest, SetupIsRandomized)
{
    threshold_circuit<FieldT> circuit(false);
    const hostsnark_keypair<hostsnark_pp> first = hostsnark_generator<hostsnark_pp>(circuit.get_constraint_system());
    const hostsnark_keypair<hostsnark_pp> second = hostsnark_generator<hostsnark_pp>(circuit.get_constraint_system());

    EXPECT_EQ(first.vk.num_public_inputs(), second.vk.num_public_inputs());
    EXPECT_FALSE(first.vk == second.vk);
    EXPECT_NE(encode_verification_key(first.vk), encode_verification_key(second.vk));
}

TEST(KeyGenerationTest, ProofDoesNotVerifyUnderForeignKey)
{
    threshold_fixture a(false);
    threshold_fixture b(false);

    execution_host host = b.make_host();
    const execution_result result = host.execute(make_account_id("prover"), b.instruction(0, a.package(42, 18, packaging_mode::standard)));
    ASSERT_TRUE(result.committed());
    EXPECT_EQ(hostsnark_error_code::pairing_failed, result.record->error);
}

}
