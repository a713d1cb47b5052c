/** @file
 *****************************************************************************

 Implementation of the scoped profiling block, see profiling_block.hpp

 *****************************************************************************/

#include <libff/common/profiling.hpp>

#include "hostsnark-codec/profiling_block.hpp"

size_t profiling_block::depth = 0;

profiling_block::profiling_block(const std::string &name) : name(name)
{
    libff::enter_block(name);
    depth++;
}

profiling_block::~profiling_block()
{
    depth--;
    libff::leave_block(name);
}
