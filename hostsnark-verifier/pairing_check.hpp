/** @file
 *****************************************************************************

 Declaration of the pairing check primitive.

 The primitive follows the alt_bn128 pairing precompile (EIP-197): its input
 is a list of k (G1, G2) pairs in host encoding, 192 bytes per pair, and it
 answers whether prod_i e(P_i, Q_i) is the identity of GT. Malformed input is
 reported as a status, never as an exception.

 The verifier never calls libff directly. It receives a pairing_check_fn so
 the host decides which implementation runs and what it costs.

 *****************************************************************************/

#ifndef HOSTSNARK_PAIRING_CHECK_HPP_
#define HOSTSNARK_PAIRING_CHECK_HPP_

#include <functional>
#include <vector>

#include "hostsnark-codec/point_codec.hpp"

const size_t PAIRING_PAIR_SIZE = G1_ENCODED_SIZE + G2_ENCODED_SIZE;

enum class pairing_status {
    ok,
    invalid_length,
    invalid_component,   // coordinate not a canonical field element
    invalid_point        // not on the curve or outside the subgroup
};

const char *pairing_status_name(pairing_status status);

class pairing_result {
public:
    pairing_status status;
    bool is_identity;

    pairing_result(pairing_status status, bool is_identity) : status(status), is_identity(is_identity) {}

    bool ok() const { return status == pairing_status::ok; }
};

class pairing_pair {
public:
    byte_vector g1;
    byte_vector g2;

    pairing_pair(const byte_vector &g1, const byte_vector &g2) : g1(g1), g2(g2) {}
};

typedef std::vector<pairing_pair> pairing_input;

byte_vector serialize_pairing_input(const pairing_input &input);
pairing_input parse_pairing_input(const byte_vector &flat);

typedef std::function<pairing_result(const pairing_input&)> pairing_check_fn;

/** libff implementation of the primitive */
pairing_result alt_bn128_pairing_check(const pairing_input &input);

/** Flat byte form, k * 192 bytes */
pairing_result alt_bn128_pairing_check_bytes(const byte_vector &flat);

#endif // HOSTSNARK_PAIRING_CHECK_HPP_
