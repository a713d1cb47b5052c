/** @file
 *****************************************************************************

 Implementation of the on-host verifier, see onchain_verifier.hpp

 *****************************************************************************/

#include <libff/common/utils.hpp>

#include "hostsnark-verifier/onchain_verifier.hpp"

namespace {

class instruction_processor : public boost::static_visitor<void> {
private:
    const onchain_verifier &verifier;
    execution_context &ctx;
    verification_record &record;

public:
    instruction_processor(const onchain_verifier &verifier, execution_context &ctx, verification_record &record) :
        verifier(verifier), ctx(ctx), record(record) {}

    void operator()(const verify_proof_instruction &instruction) const
    {
        byte_vector prepared_inputs;
        const hostsnark_error_code code = verifier.verify(instruction.proof, ctx, prepared_inputs);
        if (code == hostsnark_error_code::none)
        {
            record.accept(prepared_inputs, ctx.clock);
        }
        else
        {
            record.reject(code, ctx.clock);
        }
    }

    void operator()(const verify_proof_with_balance_instruction &instruction) const
    {
        byte_vector prepared_inputs;
        const hostsnark_error_code code = verifier.verify(instruction.proof, ctx, prepared_inputs);

        // evaluated whatever the proof outcome
        const uint64_t balance = ctx.balance_of(instruction.account_to_check);
        const bool sufficient = balance >= instruction.balance_threshold;
        record.balance_sufficient = sufficient;
        ctx.msg(FMT("", "balance %llu, required %llu",
                    (unsigned long long) balance, (unsigned long long) instruction.balance_threshold));

        if (code != hostsnark_error_code::none)
        {
            record.reject(code, ctx.clock);
        }
        else if (!sufficient)
        {
            record.reject(hostsnark_error_code::insufficient_balance, ctx.clock);
        }
        else
        {
            record.accept(prepared_inputs, ctx.clock);
        }
    }
};

}

onchain_verifier::onchain_verifier(const hostsnark_verification_key<hostsnark_pp> &vk) :
    vk(vk)
{
    if (vk.gamma_abc_g1.empty())
    {
        throw format_error("verifying key has no gamma_abc points");
    }
}

verification_record onchain_verifier::process(const instruction_envelope &envelope,
                                              const account_id &caller,
                                              execution_context &ctx) const
{
    verification_record record(caller, envelope.record_index);
    ctx.charge(ctx.config().instruction_cost, "instruction");
    ctx.msg(FMT("", "received instruction %u for record %llu",
                (unsigned) envelope.tag, (unsigned long long) envelope.record_index));

    hostsnark_instruction instruction;
    try
    {
        instruction = decode_instruction(envelope);
    }
    catch (const hostsnark_error &e)
    {
        ctx.msg(std::string("rejected: ") + e.what());
        record.reject(e.code(), ctx.clock);
        return record;
    }

    boost::apply_visitor(instruction_processor(*this, ctx, record), instruction);
    ctx.msg(std::string("record ") + verification_outcome_name(record.outcome) +
            (record.is_accepted() ? "" : std::string(": ") + error_code_name(record.error)));
    return record;
}

hostsnark_error_code onchain_verifier::verify(const packaged_proof &proof,
                                              execution_context &ctx,
                                              byte_vector &prepared_inputs_out) const
{
    try
    {
        check_packaged_shape(vk, proof);
        ctx.msg(FMT("", "validated %s proof", packaging_mode_name(proof.mode)));

        const libff::alt_bn128_G1 a = decode_g1(proof.proof_a, byte_order::big_endian);
        decode_g2(proof.proof_b, byte_order::big_endian);
        decode_g1(proof.proof_c, byte_order::big_endian);

        byte_vector negated_a;
        if (proof.mode == packaging_mode::lite)
        {
            ctx.charge(ctx.config().g1_negate_cost, "g1_negate");
            negated_a = encode_g1(negate_a(a), byte_order::big_endian);
        }
        else
        {
            negated_a = proof.proof_a;
        }

        byte_vector prepared_inputs;
        if (proof.mode == packaging_mode::prepared &&
            ctx.config().prepared_policy == prepared_inputs_policy::trust)
        {
            decode_g1(*proof.prepared_inputs, byte_order::big_endian);
            prepared_inputs = *proof.prepared_inputs;
        }
        else
        {
            const uint64_t n = proof.public_inputs.size();
            ctx.charge(n * (ctx.config().g1_mul_cost + ctx.config().g1_add_cost), "prepare_inputs");
            prepared_inputs = prepare_inputs(vk, proof.public_inputs, byte_order::big_endian);

            if (proof.mode == packaging_mode::prepared)
            {
                const libff::alt_bn128_G1 submitted = decode_g1(*proof.prepared_inputs, byte_order::big_endian);
                if (!(submitted == decode_g1(prepared_inputs, byte_order::big_endian)))
                {
                    ctx.msg("submitted prepared inputs do not match the public inputs");
                    return hostsnark_error_code::prepared_inputs_mismatch;
                }
            }
        }

        const pairing_result result = ctx.alt_bn128_pairing(
            groth16_pairing_input(vk, negated_a, proof.proof_b, prepared_inputs, proof.proof_c));
        if (!result.ok())
        {
            ctx.msg(std::string("pairing input rejected: ") + pairing_status_name(result.status));
            return hostsnark_error_code::pairing_input_error;
        }
        if (!result.is_identity)
        {
            ctx.msg("pairing check failed");
            return hostsnark_error_code::pairing_failed;
        }

        prepared_inputs_out = prepared_inputs;
        return hostsnark_error_code::none;
    }
    catch (const hostsnark_error &e)
    {
        ctx.msg(std::string("rejected: ") + e.what());
        return e.code();
    }
}
