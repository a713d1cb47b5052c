/** @file
 *****************************************************************************

 Implementation of templated input preparation, see proof_packager.hpp

 *****************************************************************************/

#ifndef HOSTSNARK_PROOF_PACKAGER_TCC_
#define HOSTSNARK_PROOF_PACKAGER_TCC_

template<typename ppT>
libff::G1<ppT> prepare_inputs(const hostsnark_verification_key<ppT> &vk,
                              const std::vector<libff::Fr<ppT>> &public_inputs)
{
    if (public_inputs.size() + 1 != vk.gamma_abc_g1.size())
    {
        throw length_mismatch_error(FMT("", "verifying key expects %zu public inputs, got %zu", vk.num_public_inputs(), public_inputs.size()));
    }

    for (size_t i = 0; i < vk.gamma_abc_g1.size(); ++i)
    {
        if (!vk.gamma_abc_g1[i].is_well_formed())
        {
            throw invalid_point_error(FMT("", "gamma_abc[%zu] is not on the curve", i));
        }
    }

    libff::G1<ppT> acc = vk.gamma_abc_g1[0];
    for (size_t i = 0; i < public_inputs.size(); ++i)
    {
        acc = acc + public_inputs[i] * vk.gamma_abc_g1[i+1];
    }
    return acc;
}

#endif // HOSTSNARK_PROOF_PACKAGER_TCC_
