#include <gtest/gtest.h>

/**
 * @brief Entry point for the gstree unit tests
 *
 * Run with: ./gstree_tests, or through CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
