/**
 * @file test_content_address.cpp
 * @brief Unit tests for content identifiers
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/content_address.h>

#include <string>
#include <vector>

namespace kcenon::chunked_upload::test {

class ContentAddressTest : public ::testing::Test {
protected:
    static auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> out;
        out.reserve(text.size());
        for (char c : text) {
            out.push_back(static_cast<std::byte>(c));
        }
        return out;
    }

    static constexpr const char* ABC_SHA256 =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    static constexpr const char* EMPTY_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
};

// Digest

TEST_F(ContentAddressTest, DigestHex_KnownVector) {
    auto data = bytes_of("abc");
    auto hex = content_addresser::digest_hex(data);

    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex.value(), ABC_SHA256);
}

TEST_F(ContentAddressTest, DigestHex_EmptyInput) {
    std::vector<std::byte> empty;
    auto hex = content_addresser::digest_hex(empty);

    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex.value(), EMPTY_SHA256);
}

// Identifier

TEST_F(ContentAddressTest, Compute_DigestDashLength) {
    auto id = content_addresser::compute(bytes_of("abc"));

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value().digest, ABC_SHA256);
    EXPECT_EQ(id.value().size, 3u);
    EXPECT_EQ(id.value().to_string(), std::string(ABC_SHA256) + "-3");
}

TEST_F(ContentAddressTest, Compute_IsDeterministic) {
    auto data = bytes_of("the same bytes every time");

    auto first = content_addresser::compute(data);
    auto second = content_addresser::compute(data);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value().to_string(), second.value().to_string());
}

TEST_F(ContentAddressTest, Compute_DifferentContentDiffers) {
    auto a = content_addresser::compute(bytes_of("chunk-a"));
    auto b = content_addresser::compute(bytes_of("chunk-b"));

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a.value().digest, b.value().digest);
}

TEST_F(ContentAddressTest, Compute_DigestIsLowercaseHex) {
    auto id = content_addresser::compute(bytes_of("Hello, World"));

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value().digest.size(), content_identifier::digest_hex_length);
    for (char c : id.value().digest) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST_F(ContentAddressTest, ProbeKey) {
    content_identifier id{ABC_SHA256, 3};
    EXPECT_EQ(id.probe_key(), std::string("sha256-") + ABC_SHA256 + "-3");
}

TEST_F(ContentAddressTest, SizeString_NoLeadingZeros) {
    content_identifier id{ABC_SHA256, 5242880};
    EXPECT_EQ(id.size_string(), "5242880");
}

// Parse

TEST_F(ContentAddressTest, Parse_SplitsIntoDigestAndSize) {
    auto id = content_identifier::parse(std::string(ABC_SHA256) + "-2097152");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value().digest, ABC_SHA256);
    EXPECT_EQ(id.value().size, 2097152u);
}

TEST_F(ContentAddressTest, Parse_RoundTripsComputedIdentifier) {
    auto computed = content_addresser::compute(bytes_of("round trip"));
    ASSERT_TRUE(computed.has_value());

    auto parsed = content_identifier::parse(computed.value().to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), computed.value());
}

TEST_F(ContentAddressTest, Parse_RejectsMissingSeparator) {
    auto id = content_identifier::parse(ABC_SHA256);

    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::invalid_content_identifier);
}

TEST_F(ContentAddressTest, Parse_RejectsShortDigest) {
    EXPECT_FALSE(content_identifier::parse("abcdef-3").has_value());
}

TEST_F(ContentAddressTest, Parse_RejectsUppercaseDigest) {
    std::string upper = ABC_SHA256;
    upper[0] = 'B';
    EXPECT_FALSE(content_identifier::parse(upper + "-3").has_value());
}

TEST_F(ContentAddressTest, Parse_RejectsNonCanonicalSize) {
    EXPECT_FALSE(content_identifier::parse(std::string(ABC_SHA256) + "-03").has_value());
    EXPECT_FALSE(content_identifier::parse(std::string(ABC_SHA256) + "-").has_value());
    EXPECT_FALSE(content_identifier::parse(std::string(ABC_SHA256) + "-3x").has_value());
    EXPECT_FALSE(content_identifier::parse(std::string(ABC_SHA256) + "-3-4").has_value());
}

TEST_F(ContentAddressTest, Parse_AcceptsZeroSize) {
    auto id = content_identifier::parse(std::string(EMPTY_SHA256) + "-0");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value().size, 0u);
}

}  // namespace kcenon::chunked_upload::test
