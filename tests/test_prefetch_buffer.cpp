#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include "../src/PrefetchBuffer.hpp"
#include "../src/RangeTypes.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        const std::string seq = "3.14159265358979";  // 16 bytes

        // Out-of-order completions are parked until contiguous
        PrefetchBuffer buf;
        ASSERT_TRUE(buf.reserve(4) == 0);
        ASSERT_TRUE(buf.reserve(4) == 4);
        ASSERT_TRUE(buf.reserve(4) == 8);
        ASSERT_TRUE(buf.nextFetchPosition() == 12);
        ASSERT_TRUE(buf.complete(8, seq.substr(8, 4)));
        ASSERT_TRUE(buf.complete(4, seq.substr(4, 4)));
        ASSERT_TRUE(buf.buffered() == 0);
        ASSERT_TRUE(buf.parked() == 2);
        ASSERT_TRUE(buf.drain(100).empty());
        ASSERT_TRUE(buf.complete(0, seq.substr(0, 4)));
        ASSERT_TRUE(buf.buffered() == 12);
        ASSERT_TRUE(buf.parked() == 0);
        ASSERT_TRUE(buf.readyEnd() == 12);

        // Duplicates and stale offsets are dropped
        ASSERT_TRUE(!buf.complete(4, "XXXX"));
        ASSERT_TRUE(!buf.complete(12, "XXXX"));
        ASSERT_TRUE(!buf.complete(100, "XXXX"));

        // Drain in bounded pieces from the front
        ASSERT_TRUE(buf.drain(5) == "3.141");
        ASSERT_TRUE(buf.consumedPosition() == 5);
        ASSERT_TRUE(buf.drain(100) == "5926535");
        ASSERT_TRUE(buf.consumedPosition() == 12);
        ASSERT_TRUE(buf.buffered() == 0);

        // A short read freezes the end; later reservations are refused
        ASSERT_TRUE(buf.reserve(4) == 12);
        ASSERT_TRUE(buf.reserve(4) == 16);
        ASSERT_TRUE(buf.reserve(4) == 20);
        ASSERT_TRUE(buf.complete(20, ""));
        buf.freezeAt(16);
        ASSERT_TRUE(buf.sequenceLength().has_value());
        ASSERT_TRUE(*buf.sequenceLength() == 16);
        ASSERT_TRUE(buf.nextFetchPosition() == 16);
        ASSERT_TRUE(buf.parked() == 0);
        ASSERT_TRUE(!buf.exhausted());
        ASSERT_TRUE(!buf.complete(16, ""));
        ASSERT_TRUE(buf.complete(12, seq.substr(12, 4)));
        ASSERT_TRUE(buf.drain(100) == "8979");
        ASSERT_TRUE(buf.exhausted());
        bool threw = false;
        try {
            buf.reserve(4);
        } catch (const std::logic_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // An earlier short read tightens a provisional end
        PrefetchBuffer tail(100);
        ASSERT_TRUE(tail.reserve(10) == 100);
        ASSERT_TRUE(tail.reserve(10) == 110);
        tail.freezeAt(110);
        tail.freezeAt(105);
        ASSERT_TRUE(*tail.sequenceLength() == 105);
        tail.freezeAt(108);
        ASSERT_TRUE(*tail.sequenceLength() == 105);
        ASSERT_TRUE(tail.complete(100, "12345"));
        ASSERT_TRUE(tail.drain(10) == "12345");
        ASSERT_TRUE(tail.exhausted());

        // Positions stop at the largest addressable offset instead of wrapping
        const std::uint64_t limit = static_cast<std::uint64_t>(kMaxOffset);
        PrefetchBuffer edge(limit - 10);
        ASSERT_TRUE(edge.reserve(10) == limit - 10);
        ASSERT_TRUE(edge.nextFetchPosition() == limit);
        threw = false;
        try {
            edge.reserve(1);
        } catch (const std::overflow_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        ASSERT_TRUE(edge.nextFetchPosition() == limit);
        ASSERT_TRUE(edge.consumedPosition() <= edge.nextFetchPosition());

        threw = false;
        try {
            PrefetchBuffer wrapped(std::numeric_limits<std::uint64_t>::max() - 100);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All prefetch buffer tests passed" << std::endl;
    return 0;
}
