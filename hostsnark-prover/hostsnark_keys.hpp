/** @file
 *****************************************************************************

 Declaration of interfaces for key generation and key artifacts.

 The proving key is libsnark's r1cs_gg_ppzksnark proving key. The verifying
 key is reshaped for the host pairing check: libsnark keeps only
 e(alpha, beta) in its verification key, the host needs alpha (G1) and
 beta (G2) as separate points, and gamma_ABC as a dense list.

 Keys are explicit values. They only touch the file system through the
 store/load functions below, which take advisory file locks (exclusive to
 write, sharable to read).

 *****************************************************************************/

#ifndef HOSTSNARK_KEYS_HPP_
#define HOSTSNARK_KEYS_HPP_

#include <string>
#include <vector>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include "hostsnark-codec/point_codec.hpp"

typedef libff::alt_bn128_pp hostsnark_pp;

template<typename ppT>
using hostsnark_constraint_system = libsnark::r1cs_gg_ppzksnark_constraint_system<ppT>;

template<typename ppT>
using hostsnark_primary_input = libsnark::r1cs_gg_ppzksnark_primary_input<ppT>;

template<typename ppT>
using hostsnark_auxiliary_input = libsnark::r1cs_gg_ppzksnark_auxiliary_input<ppT>;

template<typename ppT>
using hostsnark_proving_key = libsnark::r1cs_gg_ppzksnark_proving_key<ppT>;

template<typename ppT>
class hostsnark_verification_key {
public:
    libff::G1<ppT> alpha_g1;
    libff::G2<ppT> beta_g2;
    libff::G2<ppT> gamma_g2;
    libff::G2<ppT> delta_g2;
    std::vector<libff::G1<ppT>> gamma_abc_g1;

    size_t num_public_inputs() const {
        return gamma_abc_g1.empty() ? 0 : gamma_abc_g1.size() - 1;
    }

    bool operator==(const hostsnark_verification_key<ppT> &other) const;
};

template<typename ppT>
class hostsnark_keypair {
public:
    hostsnark_proving_key<ppT> pk;
    hostsnark_verification_key<ppT> vk;
};

template<typename ppT>
hostsnark_verification_key<ppT> hostsnark_extract_verification_key(const libsnark::r1cs_gg_ppzksnark_keypair<ppT> &keypair);

/**
 * Single party setup. Toxic waste is drawn from libff's random_element, so
 * two calls on the same constraint system give different keys.
 */
template<typename ppT>
hostsnark_keypair<ppT> hostsnark_generator(const hostsnark_constraint_system<ppT> &cs);

/**
 * Verifying key blob, host encoding (big-endian):
 * alpha(64) beta(128) gamma(128) delta(128) n:u32le gamma_abc(64*n)
 */
byte_vector encode_verification_key(const hostsnark_verification_key<hostsnark_pp> &vk);
hostsnark_verification_key<hostsnark_pp> decode_verification_key(const byte_vector &blob);

byte_vector serialize_proving_key(const hostsnark_proving_key<hostsnark_pp> &pk);
hostsnark_proving_key<hostsnark_pp> deserialize_proving_key(const byte_vector &bytes);

void store_proving_key(const std::string &path, const hostsnark_proving_key<hostsnark_pp> &pk);
hostsnark_proving_key<hostsnark_pp> load_proving_key(const std::string &path);

void store_verification_key(const std::string &path, const hostsnark_verification_key<hostsnark_pp> &vk);
hostsnark_verification_key<hostsnark_pp> load_verification_key(const std::string &path);

#include "hostsnark-prover/hostsnark_keys.tcc"

#endif // HOSTSNARK_KEYS_HPP_
