#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <thread>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer<int16_t> rb(cap);

    SECTION("PushAndPop") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(rb.push(data) == 64);
        REQUIRE(rb.size() == 64);

        std::vector<int16_t> out(64);
        REQUIRE(rb.pop(out) == 64);
        REQUIRE(out == data);
        REQUIRE(rb.size() == 0);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200);
        std::iota(fill.begin(), fill.end(), int16_t(1));
        REQUIRE(rb.push(fill) == 200);

        std::vector<int16_t> sink(200);
        REQUIRE(rb.pop(sink) == 200);
        REQUIRE(sink == fill);

        // Positions sit at 200; 128 samples cross the end of storage.
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(1000));
        REQUIRE(rb.push(wrap) == 128);

        std::vector<int16_t> out(128);
        REQUIRE(rb.pop(out) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDropsAndCounts") {
        std::vector<int16_t> big(cap + 100, int16_t(7));

        REQUIRE(rb.push(big) == cap);
        REQUIRE(rb.size() == cap);
        REQUIRE(rb.dropped() == 100);

        std::vector<int16_t> more(10, int16_t(1));
        REQUIRE(rb.push(more) == 0);
        REQUIRE(rb.dropped() == 110);
    }

    SECTION("PopAll") {
        std::vector<int16_t> samples = {100, -200, 300, -400, 500};
        rb.push(samples);

        auto drained = rb.pop_all();
        REQUIRE(drained == samples);
        REQUIRE(rb.size() == 0);
        REQUIRE(rb.pop_all().empty());
    }

    SECTION("PartialPop") {
        std::vector<int16_t> data(50, int16_t(1));
        rb.push(data);

        std::vector<int16_t> buf(20);
        REQUIRE(rb.pop(buf) == 20);
        REQUIRE(rb.size() == 30);
    }

    SECTION("EmptyPop") {
        std::vector<int16_t> buf(16);
        REQUIRE(rb.pop(buf) == 0);
    }

    SECTION("ClearDiscardsQueued") {
        std::vector<int16_t> data(32, int16_t(-1));
        rb.push(data);
        REQUIRE(rb.size() == 32);

        rb.clear();
        REQUIRE(rb.size() == 0);
        REQUIRE(rb.push(data) == 32);
    }

    SECTION("ProducerConsumerThreads") {
        constexpr int total = 20000;
        std::vector<int16_t> received;
        received.reserve(total);

        std::thread producer([&] {
            int16_t next = 0;
            while (next < total) {
                int16_t chunk[37];
                size_t n = 0;
                while (n < std::size(chunk) && next + n < total) {
                    chunk[n] = static_cast<int16_t>(next + n);
                    ++n;
                }
                size_t pushed = 0;
                while (pushed == 0) {
                    // Only push once there is room, so nothing is dropped.
                    if (rb.capacity() - rb.size() >= n) {
                        pushed = rb.push(std::span<const int16_t>(chunk, n));
                    } else {
                        std::this_thread::yield();
                    }
                }
                next = static_cast<int16_t>(next + pushed);
            }
        });

        std::vector<int16_t> buf(64);
        while (received.size() < static_cast<size_t>(total)) {
            size_t n = rb.pop(buf);
            received.insert(received.end(), buf.begin(), buf.begin() + static_cast<ptrdiff_t>(n));
            if (n == 0) std::this_thread::yield();
        }
        producer.join();

        REQUIRE(rb.dropped() == 0);
        for (int i = 0; i < total; ++i) {
            REQUIRE(received[static_cast<size_t>(i)] == static_cast<int16_t>(i));
        }
    }
}
