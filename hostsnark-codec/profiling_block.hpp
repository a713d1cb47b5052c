/** @file
 *****************************************************************************

 Scoped libff profiling block. enter_block on construction, leave_block on
 destruction, so a block is closed on every exit path including exceptions.

 *****************************************************************************/

#ifndef HOSTSNARK_PROFILING_BLOCK_HPP_
#define HOSTSNARK_PROFILING_BLOCK_HPP_

#include <cstddef>
#include <string>

class profiling_block {
private:
    const std::string name;
    static size_t depth;

public:
    explicit profiling_block(const std::string &name);
    ~profiling_block();

    profiling_block(const profiling_block &) = delete;
    profiling_block &operator=(const profiling_block &) = delete;

    /** Blocks entered through this class and not yet left */
    static size_t open_blocks() { return depth; }
};

#endif // HOSTSNARK_PROFILING_BLOCK_HPP_
