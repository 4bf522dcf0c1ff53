#include "common/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char* argv[]) {
    quickfilter::logging::InitLogger(quickfilter::logging::Level::WARNING);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
