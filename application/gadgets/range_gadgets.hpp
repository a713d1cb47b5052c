/** @file
 *****************************************************************************

 Declaration of interfaces for range gadgets

 range_gadget: checks whether a linear combination lies in [min, max] by
 decomposing value - min into bits. The top bit is weighted so that the
 largest representable offset is exactly max - min.
 *****************************************************************************/

#ifndef RANGE_GADGETS_H
#define RANGE_GADGETS_H

#include <stdexcept>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/pb_variable.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "utils.h"

template<typename FieldT>
class range_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable_array<FieldT> bits;
    unsigned long coeff_n;

public:
    int n;
    const unsigned long min;
    const unsigned long max;
    const libsnark::pb_linear_combination<FieldT> value;

    range_gadget(libsnark::protoboard<FieldT>& pb,
                       unsigned long min,
                       unsigned long max,
                       const libsnark::pb_linear_combination<FieldT> &value,
                       const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), min(min), max(max), value(value)
    {
        if (max <= min){
            throw std::invalid_argument("range_gadget needs max > min");
        }
        n = num_bits(max-min);

        // last coefficient
        coeff_n = (max - min) - (1UL << (n-1)) + 1;

        bits.allocate(pb, n, FMT(this->annotation_prefix, ".bits"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "range_gadgets.tcc"

#endif //RANGE_GADGETS_H
