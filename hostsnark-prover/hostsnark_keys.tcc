/** @file
 *****************************************************************************

 Implementation of templated key generation, see hostsnark_keys.hpp

 *****************************************************************************/

#ifndef HOSTSNARK_KEYS_TCC_
#define HOSTSNARK_KEYS_TCC_

#include <cstdio>
#include <utility>

#include <libff/common/profiling.hpp>

template<typename ppT>
bool hostsnark_verification_key<ppT>::operator==(const hostsnark_verification_key<ppT> &other) const
{
    return (this->alpha_g1 == other.alpha_g1 &&
            this->beta_g2 == other.beta_g2 &&
            this->gamma_g2 == other.gamma_g2 &&
            this->delta_g2 == other.delta_g2 &&
            this->gamma_abc_g1 == other.gamma_abc_g1);
}

template<typename ppT>
hostsnark_verification_key<ppT> hostsnark_extract_verification_key(const libsnark::r1cs_gg_ppzksnark_keypair<ppT> &keypair)
{
    hostsnark_verification_key<ppT> vk;
    vk.alpha_g1 = keypair.pk.alpha_g1;
    vk.beta_g2 = keypair.pk.beta_g2;
    vk.gamma_g2 = keypair.vk.gamma_g2;
    vk.delta_g2 = keypair.vk.delta_g2;

    // gamma_ABC is stored as first + sparse rest, expand to a dense list
    const libsnark::accumulation_vector<libff::G1<ppT>> &abc = keypair.vk.gamma_ABC_g1;
    std::vector<libff::G1<ppT>> rest(abc.rest.domain_size(), libff::G1<ppT>::zero());
    for (size_t i = 0; i < abc.rest.indices.size(); ++i)
    {
        rest[abc.rest.indices[i]] = abc.rest.values[i];
    }

    vk.gamma_abc_g1.reserve(rest.size() + 1);
    vk.gamma_abc_g1.emplace_back(abc.first);
    vk.gamma_abc_g1.insert(vk.gamma_abc_g1.end(), rest.begin(), rest.end());
    return vk;
}

template<typename ppT>
hostsnark_keypair<ppT> hostsnark_generator(const hostsnark_constraint_system<ppT> &cs)
{
    if (!cs.is_valid())
    {
        throw format_error("constraint system is not well formed");
    }

    libff::enter_block("Call to hostsnark_generator");

    libsnark::r1cs_gg_ppzksnark_keypair<ppT> keypair = libsnark::r1cs_gg_ppzksnark_generator<ppT>(cs);

    hostsnark_keypair<ppT> result;
    result.vk = hostsnark_extract_verification_key<ppT>(keypair);
    result.pk = std::move(keypair.pk);

    if (!libff::inhibit_profiling_info)
    {
        libff::print_indent(); printf("* Public inputs: %zu\n", result.vk.num_public_inputs());
    }

    libff::leave_block("Call to hostsnark_generator");
    return result;
}

#endif // HOSTSNARK_KEYS_TCC_
