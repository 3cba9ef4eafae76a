// tests/TestHarness.cpp

#include "TestHarness.hpp"
#include <Lectern/Core/Encoding.hpp>
#include <stdexcept>
#include <thread>

#include <sys/socket.h>

namespace Lectern::Testing {

bool waitFor(const std::function<bool()>& predicate, Milliseconds timeout, Milliseconds step) {
    auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(step);
    }
    return predicate();
}

ByteBuffer randomBytes(size_t size) {
    auto result = Encoding::randomBytes(size);
    if (result.isFailure()) {
        // Fall back to insecure random for testing
        ByteBuffer data(size);
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<uint8_t>(dis(gen));
        }
        return data;
    }
    return result.value();
}

std::string randomString(size_t length) {
    static const char charset[] =
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "0123456789";

    std::string result;
    result.reserve(length);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

    for (size_t i = 0; i < length; i++) {
        result += charset[dis(gen)];
    }

    return result;
}

std::pair<Network::Socket, Network::Socket> makeSocketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw std::runtime_error("socketpair failed");
    }
    return {Network::Socket(fds[0]), Network::Socket(fds[1])};
}

uint16_t freeTcpPort() {
    auto socket = Network::Socket::listenTcp("127.0.0.1", 0, 1);
    if (socket.isFailure()) {
        throw std::runtime_error("no free TCP port");
    }
    return socket.value().localPort();
}

uint16_t freeUdpPort() {
    auto socket = Network::Socket::bindUdp("0.0.0.0", 0, false);
    if (socket.isFailure()) {
        throw std::runtime_error("no free UDP port");
    }
    return socket.value().localPort();
}

// BitFlipper
void BitFlipper::flipBit(ByteBuffer& data, size_t bit_position) {
    size_t byte_pos = bit_position / 8;
    size_t bit_offset = bit_position % 8;

    if (byte_pos < data.size()) {
        data[byte_pos] ^= (1 << bit_offset);
    }
}

size_t BitFlipper::flipRandomBit(ByteBuffer& data) {
    if (data.empty()) return 0;

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> dis(0, data.size() * 8 - 1);

    size_t bit = dis(gen);
    flipBit(data, bit);
    return bit;
}

void BitFlipper::forEachBitFlip(
    const ByteBuffer& original,
    std::function<void(const ByteBuffer&, size_t)> callback) {

    for (size_t bit = 0; bit < original.size() * 8; bit++) {
        ByteBuffer modified = original;
        flipBit(modified, bit);
        callback(modified, bit);
    }
}

// SimpleFuzzer
SimpleFuzzer::SimpleFuzzer(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        m_rng.seed(rd());
    } else {
        m_rng.seed(seed);
    }
}

ByteBuffer SimpleFuzzer::generate(size_t min_size, size_t max_size) {
    std::uniform_int_distribution<size_t> size_dist(min_size, max_size);
    size_t size = size_dist(m_rng);

    ByteBuffer data(size);
    std::uniform_int_distribution<int> byte_dist(0, 255);

    for (auto& b : data) {
        b = static_cast<uint8_t>(byte_dist(m_rng));
    }

    return data;
}

std::vector<ByteBuffer> SimpleFuzzer::generateEdgeCases() {
    std::vector<ByteBuffer> cases;

    // Empty
    cases.push_back({});

    // Single byte (all values)
    for (int i = 0; i < 256; i++) {
        cases.push_back({static_cast<uint8_t>(i)});
    }

    // Truncated magic and bare headers
    cases.push_back({'A'});
    cases.push_back({'A', 'F', 'R'});
    cases.push_back({'A', 'F', 'R', 'D'});
    cases.push_back({'A', 'F', 'R', 'D', 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00});
    cases.push_back({'A', 'F', 'R', 'D', 0x00, 0x02, 0xFF, 0xFF, 0xFF, 0xFF, 0x01});

    // Powers of 2 sizes
    for (size_t size = 1; size <= 4096; size *= 2) {
        cases.push_back(ByteBuffer(size, 0x00));  // All zeros
        cases.push_back(ByteBuffer(size, 0xFF));  // All ones
    }

    return cases;
}

} // namespace Lectern::Testing
