/** @file
 *****************************************************************************

 Host configuration: compute budget, per-operation costs and the policy for
 prepared inputs submitted by the caller.

 The options are registered on a boost::program_options description so the
 same names work on the command line and in an INI style config file.

 *****************************************************************************/

#ifndef HOSTSNARK_VERIFIER_CONFIG_HPP_
#define HOSTSNARK_VERIFIER_CONFIG_HPP_

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <boost/any.hpp>
#include <boost/program_options.hpp>

enum class prepared_inputs_policy {
    rederive,   // recompute from the raw inputs, reject on mismatch
    trust       // accept the submitted point once it is on the curve
};

std::ostream& operator<<(std::ostream &out, prepared_inputs_policy policy);

/** boost::program_options hook for --prepared-inputs=rederive|trust */
void validate(boost::any &v, const std::vector<std::string> &values, prepared_inputs_policy*, int);

class verifier_config {
public:
    uint64_t compute_budget;
    uint64_t instruction_cost;
    uint64_t pairing_base_cost;
    uint64_t pairing_pair_cost;
    uint64_t g1_add_cost;
    uint64_t g1_mul_cost;
    uint64_t g1_negate_cost;
    prepared_inputs_policy prepared_policy;

    verifier_config();

    uint64_t pairing_cost(size_t num_pairs) const;
};

void add_verifier_options(boost::program_options::options_description &desc, verifier_config &config);

verifier_config load_verifier_config(const std::string &path);

#endif // HOSTSNARK_VERIFIER_CONFIG_HPP_
