/** @file
 *****************************************************************************

 Implementation of the instruction wire format, see instruction.hpp

 *****************************************************************************/

#include <algorithm>

#include <libff/common/utils.hpp>

#include "hostsnark-verifier/instruction.hpp"

account_id make_account_id(const std::string &label)
{
    if (label.size() > 32)
    {
        throw format_error("account label longer than 32 bytes");
    }
    account_id account;
    account.fill(0);
    std::copy(label.begin(), label.end(), account.begin());
    return account;
}

std::string account_id_to_hex(const account_id &account)
{
    return bytes_to_hex(array_to_bytes(account));
}

static void encode_packaged_proof(byte_writer &writer, const packaged_proof &proof)
{
    writer.put_u8((uint8_t) proof.mode);
    writer.put_bytes(proof.proof_bytes());
    writer.put_u32((uint32_t) proof.public_inputs.size());
    for (const byte_vector &input : proof.public_inputs)
    {
        writer.put_bytes(input);
    }
    if (proof.prepared_inputs)
    {
        writer.put_u8(1);
        writer.put_bytes(*proof.prepared_inputs);
    }
    else
    {
        writer.put_u8(0);
    }
}

static packaged_proof decode_packaged_proof(byte_reader &reader)
{
    packaged_proof proof;
    const uint8_t mode = reader.get_u8();
    if (mode > (uint8_t) packaging_mode::standard)
    {
        throw format_error(FMT("", "unknown packaging mode %u", (unsigned) mode));
    }
    proof.mode = (packaging_mode) mode;

    proof.proof_a = reader.get_bytes(G1_ENCODED_SIZE);
    proof.proof_b = reader.get_bytes(G2_ENCODED_SIZE);
    proof.proof_c = reader.get_bytes(G1_ENCODED_SIZE);

    const uint32_t n = reader.get_u32();
    if ((size_t) n > reader.remaining() / FIELD_ELEMENT_SIZE)
    {
        throw format_error(FMT("", "instruction declares %u public inputs but only %zu bytes follow", n, reader.remaining()));
    }
    proof.public_inputs.reserve(n);
    for (uint32_t i = 0; i < n; ++i)
    {
        proof.public_inputs.emplace_back(reader.get_bytes(FIELD_ELEMENT_SIZE));
    }

    const uint8_t has_prepared = reader.get_u8();
    if (has_prepared == 1)
    {
        proof.prepared_inputs = reader.get_bytes(G1_ENCODED_SIZE);
    }
    else if (has_prepared != 0)
    {
        throw format_error("prepared inputs flag must be 0 or 1");
    }
    return proof;
}

class instruction_encoder : public boost::static_visitor<byte_vector> {
public:
    byte_vector operator()(const verify_proof_instruction &instruction) const
    {
        byte_writer writer;
        writer.put_u8((uint8_t) instruction_tag::verify_proof);
        writer.put_u64(instruction.record_index);
        encode_packaged_proof(writer, instruction.proof);
        return writer.buffer;
    }

    byte_vector operator()(const verify_proof_with_balance_instruction &instruction) const
    {
        byte_writer writer;
        writer.put_u8((uint8_t) instruction_tag::verify_proof_with_balance);
        writer.put_u64(instruction.record_index);
        encode_packaged_proof(writer, instruction.proof);
        writer.put_u64(instruction.balance_threshold);
        writer.put_bytes(array_to_bytes(instruction.account_to_check));
        return writer.buffer;
    }
};

byte_vector encode_instruction(const hostsnark_instruction &instruction)
{
    return boost::apply_visitor(instruction_encoder(), instruction);
}

instruction_envelope decode_envelope(const byte_vector &data)
{
    byte_reader reader(data);
    instruction_envelope envelope;

    const uint8_t tag = reader.get_u8();
    if (tag > (uint8_t) instruction_tag::verify_proof_with_balance)
    {
        throw format_error(FMT("", "unknown instruction tag %u", (unsigned) tag));
    }
    envelope.tag = (instruction_tag) tag;
    envelope.record_index = reader.get_u64();
    envelope.body = reader.get_bytes(reader.remaining());
    return envelope;
}

hostsnark_instruction decode_instruction(const instruction_envelope &envelope)
{
    byte_reader reader(envelope.body);
    hostsnark_instruction result;

    if (envelope.tag == instruction_tag::verify_proof)
    {
        result = verify_proof_instruction(envelope.record_index, decode_packaged_proof(reader));
    }
    else
    {
        const packaged_proof proof = decode_packaged_proof(reader);
        const uint64_t balance_threshold = reader.get_u64();
        const byte_vector account_bytes = reader.get_bytes(32);
        account_id account;
        std::copy(account_bytes.begin(), account_bytes.end(), account.begin());
        result = verify_proof_with_balance_instruction(envelope.record_index, proof, balance_threshold, account);
    }

    if (!reader.at_end())
    {
        throw format_error(FMT("", "%zu trailing bytes after instruction", reader.remaining()));
    }
    return result;
}

hostsnark_instruction decode_instruction(const byte_vector &data)
{
    return decode_instruction(decode_envelope(data));
}
