#pragma once
#include <cstdint>
#include <time.h>

namespace Timings {
        namespace SystemClock {
                static inline uint64_t Tick() {
                        struct timespec res;

                        clock_gettime(CLOCK_MONOTONIC, &res);
                        return (res.tv_sec * 1000000000ULL) + res.tv_nsec;
                }
        } // namespace SystemClock

        template <uint64_t asNanoseconds>
        struct Unit {
                static inline uint64_t Tick() {
                        return SystemClock::Tick() / asNanoseconds;
                }

                static inline uint64_t Since(const uint64_t t) {
                        const auto now = Tick();

                        return now >= t ? now - t : 0;
                }
        };

        struct Milliseconds
            : public Unit<1000000UL> {
        };
} // namespace Timings
