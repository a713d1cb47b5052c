/** @file
 *****************************************************************************

 Implementation of interfaces for range gadgets.

 See range_gadgets.hpp

 *****************************************************************************/

#include "range_gadgets.hpp"

template<typename FieldT>
void range_gadget<FieldT>::generate_r1cs_constraints()
{
    // boolean constrain bits
    for (size_t i = 0; i < bits.size(); ++i)
    {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, bits[i], FMT(this->annotation_prefix, ".bitness_%zu", i));
    }

    FieldT coeff = FieldT::one();
    std::vector<libsnark::linear_term<FieldT> > all_terms;
    for (size_t i = 0; i < bits.size() - 1; ++i)
    {
        all_terms.emplace_back(coeff * bits[i]);
        coeff += coeff;
    }
    all_terms.emplace_back(FieldT(coeff_n) * bits.back());

    // min as offset
    all_terms.emplace_back(FieldT(min) * libsnark::pb_variable<FieldT>(0));

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, all_terms, value), FMT(this->annotation_prefix, ".sum"));
}

template<typename FieldT>
void range_gadget<FieldT>::generate_r1cs_witness()
{
    value.evaluate(this->pb);
    const FieldT r = this->pb.lc_val(value) - FieldT(min);

    // an offset outside [0, max - min] leaves the sum constraint unsatisfied
    unsigned long offset = field_fits_bits(r, n) ? r.as_ulong() : (1UL << n) - 1;
    if (offset >= coeff_n){
        this->pb.val(bits.back()) = FieldT::one();
        offset -= coeff_n;
    }else{
        this->pb.val(bits.back()) = FieldT::zero();
    }

    for (size_t i = 0; i < bits.size() - 1; ++i){
        this->pb.val(bits[i]) = ((offset >> i) & 1UL) ? FieldT::one() : FieldT::zero();
    }
}
