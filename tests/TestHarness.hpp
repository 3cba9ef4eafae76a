// tests/TestHarness.hpp
#pragma once

#include <Lectern/Core/Types.hpp>
#include <Lectern/Core/ErrorCodes.hpp>
#include <Lectern/Core/Socket.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace Lectern::Testing {

// ============================================================================
// Timing Utilities
// ============================================================================

/**
 * Poll predicate until it holds or timeout expires
 * @return Final value of the predicate
 */
bool waitFor(const std::function<bool()>& predicate,
             Milliseconds timeout = Milliseconds{3000},
             Milliseconds step = Milliseconds{10});

// ============================================================================
// Random Data Generation
// ============================================================================

/**
 * Generate random bytes for testing
 */
ByteBuffer randomBytes(size_t size);

/**
 * Generate random string
 */
std::string randomString(size_t length);

// ============================================================================
// Socket Helpers
// ============================================================================

/**
 * Two connected stream sockets (AF_UNIX socketpair)
 */
std::pair<Network::Socket, Network::Socket> makeSocketPair();

/**
 * A TCP port on 127.0.0.1 that was free a moment ago
 */
uint16_t freeTcpPort();

/**
 * A UDP port that was free a moment ago
 */
uint16_t freeUdpPort();

// ============================================================================
// Adversarial Test Helpers
// ============================================================================

/**
 * Bit flipper for tampering tests
 */
class BitFlipper {
public:
    /**
     * Flip single bit at position
     */
    static void flipBit(ByteBuffer& data, size_t bit_position);

    /**
     * Flip random bit
     */
    static size_t flipRandomBit(ByteBuffer& data);

    /**
     * Iterate all single-bit flips
     */
    static void forEachBitFlip(
        const ByteBuffer& original,
        std::function<void(const ByteBuffer& modified, size_t bit)> callback);
};

/**
 * Fuzzer for input validation tests
 */
class SimpleFuzzer {
public:
    explicit SimpleFuzzer(uint64_t seed = 0);

    ByteBuffer generate(size_t min_size, size_t max_size);

    // Generate edge-case inputs
    std::vector<ByteBuffer> generateEdgeCases();

private:
    std::mt19937_64 m_rng;
};

// ============================================================================
// Assertion Helpers
// ============================================================================

#define ASSERT_LECTERN_SUCCESS(result) \
    ASSERT_TRUE((result).isSuccess()) \
        << "Operation failed: " << ::Lectern::getErrorMessage((result).error())

#define EXPECT_LECTERN_ERROR(result, code) \
    do { \
        auto&& _r = (result); \
        ASSERT_TRUE(_r.isFailure()); \
        EXPECT_EQ(_r.error(), (code)); \
    } while (0)

} // namespace Lectern::Testing
