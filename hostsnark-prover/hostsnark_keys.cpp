/** @file
 *****************************************************************************

 Implementation of key blobs and key files, see hostsnark_keys.hpp

 *****************************************************************************/

#include <fstream>
#include <sstream>
#include <iterator>

#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <boost/interprocess/sync/sharable_lock.hpp>

#include <libff/common/utils.hpp>

#include "hostsnark-codec/profiling_block.hpp"
#include "hostsnark-prover/hostsnark_keys.hpp"

namespace ipc = boost::interprocess;

static const size_t VK_FIXED_SIZE = G1_ENCODED_SIZE + 3 * G2_ENCODED_SIZE + 4;

byte_vector encode_verification_key(const hostsnark_verification_key<hostsnark_pp> &vk)
{
    byte_writer writer;
    writer.put_bytes(encode_g1(vk.alpha_g1, byte_order::big_endian));
    writer.put_bytes(encode_g2(vk.beta_g2, byte_order::big_endian));
    writer.put_bytes(encode_g2(vk.gamma_g2, byte_order::big_endian));
    writer.put_bytes(encode_g2(vk.delta_g2, byte_order::big_endian));
    writer.put_u32((uint32_t) vk.gamma_abc_g1.size());
    for (const libff::alt_bn128_G1 &point : vk.gamma_abc_g1)
    {
        writer.put_bytes(encode_g1(point, byte_order::big_endian));
    }
    return writer.buffer;
}

hostsnark_verification_key<hostsnark_pp> decode_verification_key(const byte_vector &blob)
{
    if (blob.size() < VK_FIXED_SIZE)
    {
        throw format_error(FMT("", "verifying key blob too short: %zu bytes", blob.size()));
    }

    byte_reader reader(blob);
    hostsnark_verification_key<hostsnark_pp> vk;
    vk.alpha_g1 = decode_g1(reader.get_bytes(G1_ENCODED_SIZE), byte_order::big_endian);
    vk.beta_g2 = decode_g2(reader.get_bytes(G2_ENCODED_SIZE), byte_order::big_endian);
    vk.gamma_g2 = decode_g2(reader.get_bytes(G2_ENCODED_SIZE), byte_order::big_endian);
    vk.delta_g2 = decode_g2(reader.get_bytes(G2_ENCODED_SIZE), byte_order::big_endian);

    const uint32_t n = reader.get_u32();
    if (n == 0 || reader.remaining() != (size_t) n * G1_ENCODED_SIZE)
    {
        throw format_error(FMT("", "verifying key blob declares %u gamma_abc points but carries %zu bytes", n, reader.remaining()));
    }
    vk.gamma_abc_g1.reserve(n);
    for (uint32_t i = 0; i < n; ++i)
    {
        vk.gamma_abc_g1.emplace_back(decode_g1(reader.get_bytes(G1_ENCODED_SIZE), byte_order::big_endian));
    }
    return vk;
}

byte_vector serialize_proving_key(const hostsnark_proving_key<hostsnark_pp> &pk)
{
    std::stringstream ss;
    ss << pk;
    const std::string s = ss.str();
    return byte_vector(s.begin(), s.end());
}

hostsnark_proving_key<hostsnark_pp> deserialize_proving_key(const byte_vector &bytes)
{
    if (bytes.empty())
    {
        throw format_error("proving key is empty");
    }
    std::stringstream ss(std::string(bytes.begin(), bytes.end()));
    hostsnark_proving_key<hostsnark_pp> pk;
    ss >> pk;
    if (ss.fail())
    {
        throw format_error("malformed proving key");
    }
    return pk;
}

/**
 * Lock files sit next to the artifact so that the artifact itself can be
 * truncated and rewritten while the lock is held.
 */
static std::string lock_path_for(const std::string &path)
{
    const std::string lock_path = path + ".lock";
    std::ofstream touch(lock_path, std::ios::out | std::ios::app);
    if (!touch)
    {
        throw std::runtime_error("cannot create lock file " + lock_path);
    }
    return lock_path;
}

static void write_locked(const std::string &path, const byte_vector &content)
{
    const std::string lock_path = lock_path_for(path);
    ipc::file_lock lock(lock_path.c_str());
    ipc::scoped_lock<ipc::file_lock> guard(lock);

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    out.write(reinterpret_cast<const char*>(content.data()), content.size());
    out.close();
    if (out.fail())
    {
        throw std::runtime_error("failed writing " + path);
    }
}

static byte_vector read_locked(const std::string &path)
{
    if (!std::ifstream(path, std::ios::in | std::ios::binary))
    {
        throw std::runtime_error("cannot open " + path + " for reading");
    }

    const std::string lock_path = lock_path_for(path);
    ipc::file_lock lock(lock_path.c_str());
    ipc::sharable_lock<ipc::file_lock> guard(lock);

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("cannot open " + path + " for reading");
    }
    return byte_vector(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void store_proving_key(const std::string &path, const hostsnark_proving_key<hostsnark_pp> &pk)
{
    const profiling_block block("Store proving key");
    write_locked(path, serialize_proving_key(pk));
}

hostsnark_proving_key<hostsnark_pp> load_proving_key(const std::string &path)
{
    const profiling_block block("Load proving key");
    return deserialize_proving_key(read_locked(path));
}

void store_verification_key(const std::string &path, const hostsnark_verification_key<hostsnark_pp> &vk)
{
    write_locked(path, encode_verification_key(vk));
}

hostsnark_verification_key<hostsnark_pp> load_verification_key(const std::string &path)
{
    return decode_verification_key(read_locked(path));
}
