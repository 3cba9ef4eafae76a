/**
 * @file test_encoding.cpp
 * @brief Unit tests for base64, hex, hashing and host identity helpers
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Lectern/Core/Encoding.hpp>
#include "TestHarness.hpp"

using namespace Lectern;
using namespace Lectern::Testing;

// ============================================================================
// Base64
// ============================================================================

TEST(EncodingTest, Base64KnownVectors) {
    // RFC 4648 section 10
    EXPECT_EQ(Encoding::toBase64(asBytes("")), "");
    EXPECT_EQ(Encoding::toBase64(asBytes("f")), "Zg==");
    EXPECT_EQ(Encoding::toBase64(asBytes("fo")), "Zm8=");
    EXPECT_EQ(Encoding::toBase64(asBytes("foo")), "Zm9v");
    EXPECT_EQ(Encoding::toBase64(asBytes("foobar")), "Zm9vYmFy");
}

TEST(EncodingTest, Base64Decode) {
    auto decoded = Encoding::fromBase64("Zm9vYg==");
    ASSERT_LECTERN_SUCCESS(decoded);
    EXPECT_EQ(std::string(decoded.value().begin(), decoded.value().end()), "foob");

    auto empty = Encoding::fromBase64("");
    ASSERT_LECTERN_SUCCESS(empty);
    EXPECT_TRUE(empty.value().empty());
}

TEST(EncodingTest, Base64BinaryData) {
    ByteBuffer data = randomBytes(1001);
    std::string text = Encoding::toBase64(data);
    EXPECT_EQ(text.size() % 4, 0u);

    auto decoded = Encoding::fromBase64(text);
    ASSERT_LECTERN_SUCCESS(decoded);
    EXPECT_EQ(decoded.value(), data);
}

TEST(EncodingTest, Base64RejectsMalformedInput) {
    EXPECT_LECTERN_ERROR(Encoding::fromBase64("abc"), ErrorCode::InvalidBase64);
    EXPECT_LECTERN_ERROR(Encoding::fromBase64("ab!d"), ErrorCode::InvalidBase64);
}

// ============================================================================
// Hex and hashing
// ============================================================================

TEST(EncodingTest, Hex) {
    ByteBuffer data = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(Encoding::toHex(data), "000fa5ff");
    EXPECT_EQ(Encoding::toHex(ByteSpan()), "");
}

TEST(EncodingTest, Sha256KnownVector) {
    auto digest = Encoding::sha256(asBytes("abc"));
    ASSERT_LECTERN_SUCCESS(digest);
    EXPECT_EQ(Encoding::toHex(digest.value()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EncodingTest, RandomBytes) {
    auto a = Encoding::randomBytes(32);
    auto b = Encoding::randomBytes(32);
    ASSERT_LECTERN_SUCCESS(a);
    ASSERT_LECTERN_SUCCESS(b);
    EXPECT_EQ(a.value().size(), 32u);
    EXPECT_NE(a.value(), b.value());

    auto none = Encoding::randomBytes(0);
    ASSERT_LECTERN_SUCCESS(none);
    EXPECT_TRUE(none.value().empty());
}

// ============================================================================
// Host identity
// ============================================================================

TEST(EncodingTest, MachineIdentifierIsStable) {
    std::string first = Encoding::machineIdentifier();
    std::string second = Encoding::machineIdentifier();

    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
    // Usable inside a participant id
    EXPECT_EQ(first.find('_'), std::string::npos);
}
