#include <gtest/gtest.h>

#include <filesystem>

#include "TransferTestHelpers.h"
#include "Transfer/TransferError.h"
#include "Transfer/UriResolver.h"

using namespace Courier::Core;
using namespace Courier::Core::Transfer;
using courier::test_helpers::ScopedLogCapture;

TEST(UriResolver, BarePathResolvesToAbsoluteLocal) {
    UriResolver resolver(IO::BackendRegistry::createDefault());
    auto r = resolver.resolve("some/dir/../file.txt/");

    EXPECT_EQ(r.handle.protocol(), "file");
    auto expected = (std::filesystem::current_path() / "some/file.txt").lexically_normal().generic_string();
    EXPECT_EQ(r.path, expected);
    EXPECT_FALSE(r.handle.isContentAddressed());
}

TEST(UriResolver, SchemeSelectsBackendAndKeepsAlias) {
    auto registry = IO::BackendRegistry::createDefault();
    UriResolver resolver(registry);

    auto a = resolver.resolve("mem://bucket/key");
    auto b = resolver.resolve("memory://bucket/key");
    EXPECT_EQ(a.handle.protocol(), "mem");
    EXPECT_EQ(b.handle.protocol(), "memory");
    EXPECT_EQ(a.path, "bucket/key");
    EXPECT_TRUE(a.handle.sameBackend(b.handle));
    EXPECT_EQ(a.handle.describe(a.path), "mem://bucket/key");
}

TEST(UriResolver, UnknownScheme_IsBackendUnavailable) {
    UriResolver resolver(IO::BackendRegistry::createDefault());
    try {
        resolver.resolve("s3://bucket/key");
        FAIL() << "expected BackendUnavailable";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::BackendUnavailable);
    }
}

TEST(UriResolver, RepositorySchemeWithoutSession_NamesLogin) {
    UriResolver resolver(IO::BackendRegistry::createDefault());
    try {
        resolver.resolve("xet://alice/repo/main");
        FAIL() << "expected BackendUnavailable";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::BackendUnavailable);
        EXPECT_NE(std::string(e.what()).find("log in"), std::string::npos);
    }
}

TEST(UriResolver, EmptySchemeOrUri_IsInvalidUri) {
    UriResolver resolver(IO::BackendRegistry::createDefault());
    EXPECT_THROW(resolver.resolve(""), TransferError);
    try {
        resolver.resolve("://nothing");
        FAIL() << "expected InvalidUri";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrc::InvalidUri);
    }
}

TEST(UriResolver, ExtraSeparatorsWarnAndKeepSecondPart) {
    ScopedLogCapture capture;
    UriResolver resolver(IO::BackendRegistry::createDefault());

    auto r = resolver.resolve("memory://a://b");
    EXPECT_EQ(r.handle.protocol(), "memory");
    EXPECT_EQ(r.path, "a");
    EXPECT_TRUE(capture.sink().contains("Invalid URL: memory://a://b"));
}

TEST(UriResolver, ContentAddressedFactoryIsUsedForRepositoryScheme) {
    auto registry = IO::BackendRegistry::createDefault();
    auto mock = std::make_shared<courier::test_helpers::MockRepositoryBackend>();
    registry->setContentAddressedFactory([mock]() { return mock; });
    UriResolver resolver(registry);

    auto r = resolver.resolve("xet://alice/repo/main/file");
    EXPECT_EQ(r.handle.protocol(), "xet");
    EXPECT_EQ(r.path, "alice/repo/main/file");
    EXPECT_NE(r.handle.transactional(), nullptr);
    EXPECT_TRUE(r.handle.isContentAddressed());
}
