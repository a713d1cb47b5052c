/** @file
 *****************************************************************************

 Declaration of interfaces for packaging proofs for the execution host.

 The host checks
     e(-A, B) * e(alpha, beta) * e(prepared_inputs, gamma) * e(C, delta) == 1
 where prepared_inputs = gamma_abc[0] + sum_i input[i] * gamma_abc[i+1].
 The three packaging modes differ in who negates A and who accumulates the
 public inputs:

 lite:      nothing precomputed, the host negates A and accumulates inputs.
 prepared:  A negated and prepared_inputs computed off-host. The raw inputs
            are still carried so the host can re-derive the point.
 standard:  A negated off-host, inputs accumulated on the host.

 All packaged byte strings use the host encoding (big-endian).

 *****************************************************************************/

#ifndef HOSTSNARK_PROOF_PACKAGER_HPP_
#define HOSTSNARK_PROOF_PACKAGER_HPP_

#include <boost/optional.hpp>

#include "hostsnark-prover/hostsnark_prover.hpp"
#include "hostsnark-verifier/pairing_check.hpp"

enum class packaging_mode : uint8_t {
    lite = 0,
    prepared = 1,
    standard = 2
};

const char *packaging_mode_name(packaging_mode mode);
packaging_mode parse_packaging_mode(const std::string &name);
std::ostream& operator<<(std::ostream &out, packaging_mode mode);

class packaged_proof {
public:
    packaging_mode mode;
    byte_vector proof_a;  // negated unless mode is lite
    byte_vector proof_b;
    byte_vector proof_c;
    std::vector<byte_vector> public_inputs;
    boost::optional<byte_vector> prepared_inputs;

    packaged_proof() : mode(packaging_mode::lite) {}

    /** A || B || C, 256 bytes */
    byte_vector proof_bytes() const;

    bool operator==(const packaged_proof &other) const;
};

/** (x, y) -> (x, q - y). Throws invalid_point_error if the point is not on the curve. */
libff::alt_bn128_G1 negate_a(const libff::alt_bn128_G1 &point);

/** Byte level negation of an encoded G1 point */
byte_vector negate_g1(const byte_vector &point, byte_order order=byte_order::big_endian);

template<typename ppT>
libff::G1<ppT> prepare_inputs(const hostsnark_verification_key<ppT> &vk,
                              const std::vector<libff::Fr<ppT>> &public_inputs);

byte_vector prepare_inputs(const hostsnark_verification_key<hostsnark_pp> &vk,
                           const std::vector<byte_vector> &public_inputs,
                           byte_order order=byte_order::big_endian);

/**
 * Convert a raw proof (prover encoding) and its raw public inputs into the
 * host encoding and precompute what mode asks for.
 */
packaged_proof package_proof(const byte_vector &raw_proof,
                             const std::vector<byte_vector> &raw_public_inputs,
                             const hostsnark_verification_key<hostsnark_pp> &vk,
                             packaging_mode mode);

/**
 * Byte shape of a packaged proof against the verifying key: component
 * widths, public input count, and prepared inputs present exactly when the
 * mode is prepared. Throws format_error.
 */
void check_packaged_shape(const hostsnark_verification_key<hostsnark_pp> &vk, const packaged_proof &proof);

/** [(-A, B), (alpha, beta), (prepared_inputs, gamma), (C, delta)] in host encoding */
pairing_input groth16_pairing_input(const hostsnark_verification_key<hostsnark_pp> &vk,
                                    const byte_vector &negated_a,
                                    const byte_vector &b,
                                    const byte_vector &prepared_inputs,
                                    const byte_vector &c);

/**
 * Off-host check of a packaged proof before it is submitted. Runs the same
 * pairing list as the host and reports the code the host would store,
 * hostsnark_error_code::none if the proof verifies. Submitted prepared inputs
 * are always re-derived and compared.
 */
hostsnark_error_code verify_packaged_proof(const hostsnark_verification_key<hostsnark_pp> &vk,
                                           const packaged_proof &proof,
                                           const pairing_check_fn &pairing_check=alt_bn128_pairing_check);

#include "hostsnark-prover/proof_packager.tcc"

#endif // HOSTSNARK_PROOF_PACKAGER_HPP_
