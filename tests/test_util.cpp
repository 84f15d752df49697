/// @file test_util.cpp
/// Unit tests for util.hpp: URL parsing, port extraction, paths and random hex.

#include "util.hpp"

#include <gtest/gtest.h>
#include <cctype>
#include <stdexcept>

using namespace kube_auth_proxy;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpsWithPort) {
    auto parts = parseUrl("https://prod.example.com:6443/");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "prod.example.com");
    EXPECT_EQ(parts.port, "6443");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://api.cluster.local/k8s");
    EXPECT_EQ(parts.host, "api.cluster.local");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/k8s");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.port, "80");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("https://10.0.0.1:6443");
    EXPECT_EQ(parts.host, "10.0.0.1");
    EXPECT_EQ(parts.port, "6443");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, BracketedIpv6Host) {
    auto parts = parseUrl("https://[fd00::1]:6443/");
    EXPECT_EQ(parts.host, "fd00::1");
    EXPECT_EQ(parts.port, "6443");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("prod.example.com:6443"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://example.com/"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("https:///api"), std::invalid_argument);
}

TEST(ParseUrl, BadPortThrows) {
    EXPECT_THROW(parseUrl("https://example.com:http/"), std::invalid_argument);
    EXPECT_THROW(parseUrl("https://example.com:70000/"), std::invalid_argument);
}

TEST(ParseUrl, UnterminatedIpv6Throws) {
    EXPECT_THROW(parseUrl("https://[fd00::1:6443/"), std::invalid_argument);
}

// ============================================================================
// parseTrailingPort
// ============================================================================

TEST(ParseTrailingPort, Ipv4Address) {
    EXPECT_EQ(parseTrailingPort("127.0.0.1:8001"), uint16_t(8001));
}

TEST(ParseTrailingPort, Ipv6Address) {
    EXPECT_EQ(parseTrailingPort("[::1]:37421"), uint16_t(37421));
}

TEST(ParseTrailingPort, HostnameAddress) {
    EXPECT_EQ(parseTrailingPort("localhost:65535"), uint16_t(65535));
}

TEST(ParseTrailingPort, TrailingWhitespaceIsIgnored) {
    EXPECT_EQ(parseTrailingPort("127.0.0.1:8443 \r\n"), uint16_t(8443));
}

TEST(ParseTrailingPort, RejectsMissingPort) {
    EXPECT_FALSE(parseTrailingPort("127.0.0.1").has_value());
    EXPECT_FALSE(parseTrailingPort("127.0.0.1:").has_value());
    EXPECT_FALSE(parseTrailingPort("").has_value());
}

TEST(ParseTrailingPort, RejectsOutOfRange) {
    EXPECT_FALSE(parseTrailingPort("127.0.0.1:0").has_value());
    EXPECT_FALSE(parseTrailingPort("127.0.0.1:65536").has_value());
    EXPECT_FALSE(parseTrailingPort("127.0.0.1:123456").has_value());
}

TEST(ParseTrailingPort, RejectsNonDigits) {
    EXPECT_FALSE(parseTrailingPort("127.0.0.1:80a").has_value());
    EXPECT_FALSE(parseTrailingPort("127.0.0.1:-1").has_value());
}

// ============================================================================
// dirnameOf
// ============================================================================

TEST(DirnameOf, RegularPath) {
    EXPECT_EQ(dirnameOf("/home/user/.kube/config"), "/home/user/.kube");
}

TEST(DirnameOf, FileInRoot) {
    EXPECT_EQ(dirnameOf("/config"), "/");
}

TEST(DirnameOf, RelativeFileHasDotDirectory) {
    EXPECT_EQ(dirnameOf("config"), ".");
    EXPECT_EQ(dirnameOf(""), ".");
}

TEST(DirnameOf, TrailingAndRepeatedSlashes) {
    EXPECT_EQ(dirnameOf("/a/b/"), "/a");
    EXPECT_EQ(dirnameOf("/a//b"), "/a");
    EXPECT_EQ(dirnameOf("///"), "/");
}

// ============================================================================
// randomHex
// ============================================================================

TEST(RandomHex, LengthIsTwicePerByte) {
    EXPECT_EQ(randomHex(8).size(), 16u);
    EXPECT_EQ(randomHex(0).size(), 0u);
}

TEST(RandomHex, OnlyLowercaseHexDigits) {
    const auto hex = randomHex(32);
    for (char c : hex) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << c;
        EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c))) << c;
    }
}

TEST(RandomHex, SuccessiveValuesDiffer) {
    EXPECT_NE(randomHex(8), randomHex(8));
}
