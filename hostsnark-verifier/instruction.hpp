/** @file
 *****************************************************************************

 Declaration of the instruction wire format.

 All integers are little-endian.

 envelope:   u8 tag | u64 record_index | body
 body:       u8 mode | proof[256] | u32 n | n * input[32]
             | u8 has_prepared | prepared[64] if has_prepared
 tag 1 adds: u64 balance_threshold | account[32]

 tag 0 is verify_proof, tag 1 verify_proof_with_balance. Trailing bytes are
 rejected. The envelope is parsed by the host to address the record, the body
 is parsed by the verifier so that a malformed body still produces a
 rejected record.

 *****************************************************************************/

#ifndef HOSTSNARK_INSTRUCTION_HPP_
#define HOSTSNARK_INSTRUCTION_HPP_

#include <array>

#include <boost/variant.hpp>

#include "hostsnark-prover/proof_packager.hpp"

typedef std::array<unsigned char, 32> account_id;

/** Deterministic account id for a human readable label, for tests and the demo */
account_id make_account_id(const std::string &label);
std::string account_id_to_hex(const account_id &account);

enum class instruction_tag : uint8_t {
    verify_proof = 0,
    verify_proof_with_balance = 1
};

class verify_proof_instruction {
public:
    uint64_t record_index;
    packaged_proof proof;

    verify_proof_instruction() : record_index(0) {}
    verify_proof_instruction(uint64_t record_index, const packaged_proof &proof) :
        record_index(record_index), proof(proof) {}
};

class verify_proof_with_balance_instruction {
public:
    uint64_t record_index;
    packaged_proof proof;
    uint64_t balance_threshold;
    account_id account_to_check;

    verify_proof_with_balance_instruction() : record_index(0), balance_threshold(0), account_to_check() {}
    verify_proof_with_balance_instruction(uint64_t record_index,
                                          const packaged_proof &proof,
                                          uint64_t balance_threshold,
                                          const account_id &account_to_check) :
        record_index(record_index), proof(proof),
        balance_threshold(balance_threshold), account_to_check(account_to_check) {}
};

typedef boost::variant<verify_proof_instruction, verify_proof_with_balance_instruction> hostsnark_instruction;

class instruction_envelope {
public:
    instruction_tag tag;
    uint64_t record_index;
    byte_vector body;
};

byte_vector encode_instruction(const hostsnark_instruction &instruction);

/** Throws format_error on an unknown tag or a truncated header */
instruction_envelope decode_envelope(const byte_vector &data);

/** Throws format_error on any malformed body */
hostsnark_instruction decode_instruction(const instruction_envelope &envelope);

hostsnark_instruction decode_instruction(const byte_vector &data);

#endif // HOSTSNARK_INSTRUCTION_HPP_
