#include <gtest/gtest.h>

#include <cstdlib>

#include "TransferTestHelpers.h"
#include "Transfer/TransferConfig.h"

using namespace Courier::Core::Transfer;
using courier::test_helpers::ScopedLogCapture;

namespace {
    class ScopedEnv {
    public:
        ScopedEnv(const char* name, const char* value) : _name(name) {
            ::setenv(name, value, 1);
        }
        ~ScopedEnv() { ::unsetenv(_name); }

    private:
        const char* _name;
    };
}

TEST(TransferConfig, DefaultsMatchDocumentedValues) {
    TransferConfig config;
    EXPECT_EQ(config.chunkSize, 16u * 1024u * 1024u);
    EXPECT_EQ(config.maxConcurrentCopies, 32u);
    EXPECT_EQ(config.largeObjectThreshold, 50000000u);
    EXPECT_EQ(config.attributesMarker, ".gitattributes");
}

TEST(TransferConfig, EnvironmentOverridesDefaults) {
    ScopedEnv chunk("COURIER_CHUNK_SIZE", "4096");
    ScopedEnv copies("COURIER_MAX_CONCURRENT_COPIES", "3");

    auto config = TransferConfig::fromEnvironment();
    EXPECT_EQ(config.chunkSize, 4096u);
    EXPECT_EQ(config.maxConcurrentCopies, 3u);
}

TEST(TransferConfig, InvalidEnvironmentValueIsIgnoredWithWarning) {
    ScopedLogCapture capture;
    ScopedEnv chunk("COURIER_CHUNK_SIZE", "lots");

    auto config = TransferConfig::fromEnvironment();
    EXPECT_EQ(config.chunkSize, TransferConfig{}.chunkSize);
    EXPECT_GE(capture.sink().count(Courier::Core::Logging::LogLevel::Warning), 1u);
}
