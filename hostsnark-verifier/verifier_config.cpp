/** @file
 *****************************************************************************

 Implementation of the host configuration, see verifier_config.hpp

 Default costs follow the Solana runtime's alt_bn128 syscall prices.

 *****************************************************************************/

#include "hostsnark-verifier/verifier_config.hpp"

namespace po = boost::program_options;

std::ostream& operator<<(std::ostream &out, prepared_inputs_policy policy)
{
    out << (policy == prepared_inputs_policy::trust ? "trust" : "rederive");
    return out;
}

void validate(boost::any &v, const std::vector<std::string> &values, prepared_inputs_policy*, int)
{
    po::validators::check_first_occurrence(v);
    const std::string &s = po::validators::get_single_string(values);
    if (s == "rederive")
    {
        v = boost::any(prepared_inputs_policy::rederive);
    }
    else if (s == "trust")
    {
        v = boost::any(prepared_inputs_policy::trust);
    }
    else
    {
        throw po::invalid_option_value(s);
    }
}

verifier_config::verifier_config() :
    compute_budget(200000),
    instruction_cost(1000),
    pairing_base_cost(36364),
    pairing_pair_cost(12121),
    g1_add_cost(334),
    g1_mul_cost(3840),
    g1_negate_cost(334),
    prepared_policy(prepared_inputs_policy::rederive)
{
}

uint64_t verifier_config::pairing_cost(size_t num_pairs) const
{
    if (num_pairs == 0)
    {
        return pairing_base_cost;
    }
    return pairing_base_cost + pairing_pair_cost * (num_pairs - 1);
}

void add_verifier_options(po::options_description &desc, verifier_config &config)
{
    desc.add_options()
            ("compute-budget", po::value<uint64_t>(&config.compute_budget)->default_value(config.compute_budget), "compute units per invocation")
            ("instruction-cost", po::value<uint64_t>(&config.instruction_cost)->default_value(config.instruction_cost), "base cost of an instruction")
            ("pairing-base-cost", po::value<uint64_t>(&config.pairing_base_cost)->default_value(config.pairing_base_cost), "pairing check, first pair")
            ("pairing-pair-cost", po::value<uint64_t>(&config.pairing_pair_cost)->default_value(config.pairing_pair_cost), "pairing check, each further pair")
            ("g1-add-cost", po::value<uint64_t>(&config.g1_add_cost)->default_value(config.g1_add_cost), "G1 addition")
            ("g1-mul-cost", po::value<uint64_t>(&config.g1_mul_cost)->default_value(config.g1_mul_cost), "G1 scalar multiplication")
            ("g1-negate-cost", po::value<uint64_t>(&config.g1_negate_cost)->default_value(config.g1_negate_cost), "G1 negation")
            ("prepared-inputs", po::value<prepared_inputs_policy>(&config.prepared_policy)->default_value(config.prepared_policy), "rederive|trust submitted prepared inputs");
}

verifier_config load_verifier_config(const std::string &path)
{
    verifier_config config;
    po::options_description desc("Verifier");
    add_verifier_options(desc, config);

    po::variables_map vm;
    po::store(po::parse_config_file<char>(path.c_str(), desc), vm);
    po::notify(vm);
    return config;
}
