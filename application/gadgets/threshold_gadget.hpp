/** @file
 *****************************************************************************

 Declaration of interfaces for the threshold gadget and circuit

 threshold_gadget: proves value >= threshold for value, threshold < 2^bits.
 Both value and value - threshold are range checked into [0, 2^bits - 1],
 which rules out a wrap-around in the field.

 threshold_circuit: protoboard setup around the gadget. The threshold is
 always public. The value stays secret unless disclose_value is set, in
 which case it becomes a second public input.
 *****************************************************************************/

#ifndef THRESHOLD_GADGET_H
#define THRESHOLD_GADGET_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp"
#include "range_gadgets.hpp"

template<typename FieldT>
class threshold_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<range_gadget<FieldT>> range_value;
    std::shared_ptr<range_gadget<FieldT>> range_difference;

public:
    const libsnark::pb_variable<FieldT> value;
    const libsnark::pb_variable<FieldT> threshold;
    const size_t bits;

    threshold_gadget(libsnark::protoboard<FieldT>& pb,
                     const libsnark::pb_variable<FieldT> &value,
                     const libsnark::pb_variable<FieldT> &threshold,
                     size_t bits,
                     const std::string &annotation_prefix="");

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class threshold_circuit {
private:
    libsnark::pb_variable<FieldT> threshold;
    libsnark::pb_variable<FieldT> value;

public:
    static const size_t VALUE_BITS = 32;

    libsnark::protoboard<FieldT> pb;
    std::shared_ptr<threshold_gadget<FieldT>> g;
    const bool disclose_value;

    threshold_circuit(bool disclose_value=false, const std::string &annotation_prefix="threshold");

    void generate_r1cs_witness(unsigned long value_val, unsigned long threshold_val);

    size_t num_public_inputs() const { return disclose_value ? 2 : 1; }
    libsnark::r1cs_constraint_system<FieldT> get_constraint_system() const { return pb.get_constraint_system(); }
    libsnark::r1cs_primary_input<FieldT> primary_input() const { return pb.primary_input(); }
    libsnark::r1cs_auxiliary_input<FieldT> auxiliary_input() const { return pb.auxiliary_input(); }
};

#include "threshold_gadget.tcc"

#endif //THRESHOLD_GADGET_H
