/** @file
 *****************************************************************************

 utilities for gadgets.

 *****************************************************************************/

#include <stdexcept>

#include "utils.h"

int num_bits(unsigned long value){
    int n = 0;
    while(value > 0){
        value >>= 1;
        n += 1;
    }
    return n;
}

unsigned long max_unsigned_value(size_t n){
    if (n >= 8 * sizeof(unsigned long)){
        throw std::invalid_argument("bit width too large");
    }
    return (1UL << n) - 1;
}
