/** @file
 *****************************************************************************

 Test runner: curve parameters are initialized once for every suite.

 *****************************************************************************/

#include <gtest/gtest.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    libff::alt_bn128_pp::init_public_params();
    libff::start_profiling();
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;

    return RUN_ALL_TESTS();
}
