/** @file
 *****************************************************************************

 Implementation of interfaces for the threshold gadget and circuit.

 See threshold_gadget.hpp

 *****************************************************************************/

#include <iostream>

#include "libff/common/profiling.hpp"
#include "threshold_gadget.hpp"

template<typename FieldT>
threshold_gadget<FieldT>::threshold_gadget(libsnark::protoboard<FieldT>& pb,
                                           const libsnark::pb_variable<FieldT> &value,
                                           const libsnark::pb_variable<FieldT> &threshold,
                                           size_t bits,
                                           const std::string &annotation_prefix) :
        libsnark::gadget<FieldT>(pb, annotation_prefix), value(value), threshold(threshold), bits(bits)
{
    const unsigned long max = max_unsigned_value(bits);
    range_value.reset(new range_gadget<FieldT>(pb, 0, max, value, FMT(this->annotation_prefix, ".range_value")));
    range_difference.reset(new range_gadget<FieldT>(pb, 0, max,
                                                    libsnark::pb_linear_combination<FieldT>(pb, value - threshold),
                                                    FMT(this->annotation_prefix, ".range_difference")));
}

template<typename FieldT>
void threshold_gadget<FieldT>::generate_r1cs_constraints()
{
    range_value->generate_r1cs_constraints();
    range_difference->generate_r1cs_constraints();
}

template<typename FieldT>
void threshold_gadget<FieldT>::generate_r1cs_witness()
{
    range_value->generate_r1cs_witness();
    range_difference->generate_r1cs_witness();
}

template<typename FieldT>
const size_t threshold_circuit<FieldT>::VALUE_BITS;

template<typename FieldT>
threshold_circuit<FieldT>::threshold_circuit(bool disclose_value, const std::string &annotation_prefix) :
        pb(), disclose_value(disclose_value)
{
    // public inputs are allocated first: threshold, then value if disclosed
    threshold.allocate(pb, "threshold");
    value.allocate(pb, "value");
    pb.set_input_sizes(num_public_inputs());

    g.reset(new threshold_gadget<FieldT>(pb, value, threshold, VALUE_BITS, annotation_prefix));
    g->generate_r1cs_constraints();

    if (!libff::inhibit_profiling_info)
    {
        std::cout << "Number of constraints: " << pb.num_constraints() << std::endl;
    }
}

template<typename FieldT>
void threshold_circuit<FieldT>::generate_r1cs_witness(unsigned long value_val, unsigned long threshold_val)
{
    pb.val(threshold) = FieldT(threshold_val, true);
    pb.val(value) = FieldT(value_val, true);
    g->generate_r1cs_witness();
}
