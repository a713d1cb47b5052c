/** @file
 *****************************************************************************

 interfaces for utilities for using gadgets.

 *****************************************************************************/


#ifndef GADGET_UTILS_H
#define GADGET_UTILS_H

#include <libff/common/utils.hpp>
#include <libff/algebra/field_utils/bigint.hpp>

int num_bits(unsigned long value);

/**
 * Largest value representable with n bits, n < 64
 */
unsigned long max_unsigned_value(size_t n);

template<typename FieldT>
bool field_fits_bits(const FieldT &v, size_t n){
    return v.as_bigint().num_bits() <= n;
}

template<typename FieldT>
unsigned long field_to_unsigned_long(const FieldT &v){
    if (!field_fits_bits(v, 8 * sizeof(unsigned long))){
        throw std::out_of_range("field element does not fit an unsigned long");
    }
    return v.as_ulong();
}

#endif //GADGET_UTILS_H
