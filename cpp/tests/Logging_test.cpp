// Logging_test.cpp
#include "gtest/gtest.h"
#include "Logging.h"
#include "Errors.h"

using namespace ipsim;

TEST(Logging, Levels) {
    EXPECT_NO_THROW(initLogging("debug"));
    EXPECT_NO_THROW(initLogging("error"));
    EXPECT_THROW(initLogging("loud"), ConfigurationError);
    EXPECT_NO_THROW(initLogging("info"));
}
