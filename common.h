#pragma once
#include "print.h"
#include "timings.h"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <robin_hood.h>
#include <string>
#include <tl/optional.hpp>
#include <type_traits>
#include <vector>

#define SLUICE_RUNTIME_CHECKS 1

#ifdef SLUICE_RUNTIME_CHECKS
#define SLUICE_EXPECT(...) do { assert(__VA_ARGS__); } while (0)
#else
#define SLUICE_EXPECT(...) \
        do {               \
        } while (0)
#endif

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

// Src: folly
template <class Lambda>
class AtScopeExit final {
      private:
        Lambda &l;

      public:
        AtScopeExit(Lambda &action)
            : l(action) {
        }

        ~AtScopeExit() {
                l();
        }
};

#define _SLUICE_TOKEN_PASTE(x, y) x##y
#define SLUICE_TOKEN_PASTE(x, y) _SLUICE_TOKEN_PASTE(x, y)
#define DEFER(...)                                                                  \
        auto SLUICE_TOKEN_PASTE(__defer_fn, __LINE__) = [&]() { __VA_ARGS__; };     \
        AtScopeExit<decltype(SLUICE_TOKEN_PASTE(__defer_fn, __LINE__))> SLUICE_TOKEN_PASTE(__deferred, __LINE__)(SLUICE_TOKEN_PASTE(__defer_fn, __LINE__))

namespace SluiceFlags {
        enum class BundleMsgFlags : uint8_t {
                HaveKey            = 1,
                UseLastSpecifiedTS = 2,
                HaveOffsetDelta    = 4,
        };
}

namespace Sluice_Limits {
        static constexpr const std::size_t max_topic_partitions{65530};
        static constexpr const std::size_t max_topic_name_len{255};
        // a fetch buffer is never grown past this, even when max_buffer_size is disabled
        static constexpr const uint64_t max_fetch_buffer_size{1ull << 31};
} // namespace Sluice_Limits

struct topic_partition final {
        std::string topic;
        uint16_t    partition{0};

        topic_partition() = default;

        topic_partition(std::string t, const uint16_t p)
            : topic{std::move(t)}
            , partition{p} {
        }

        bool operator==(const topic_partition &o) const noexcept {
                return partition == o.partition && topic == o.topic;
        }

        bool operator!=(const topic_partition &o) const noexcept {
                return !(*this == o);
        }

        bool operator<(const topic_partition &o) const noexcept {
                const auto r = topic.compare(o.topic);

                return r < 0 || (r == 0 && partition < o.partition);
        }
};

// specialize here otherwise robin_hood and the std containers will fail
namespace std {
        template <>
        struct hash<topic_partition> {
                using argument_type = topic_partition;
                using result_type   = std::size_t;

                inline result_type operator()(const argument_type &v) const noexcept {
                        size_t hash{2166136261U};

                        for (const auto c : v.topic) {
                                hash = (hash * 16777619) ^ static_cast<uint8_t>(c);
                        }

                        hash ^= std::hash<uint16_t>{}(v.partition) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
                        return hash;
                }
        };
} // namespace std

inline void PrintImpl(std::string &out, const topic_partition &tp) {
        out.append(tp.topic);
        out.push_back('/');
        PrintImpl(out, tp.partition);
}

// Cooperative cancellation, checked by every loop that may block or retry.
// wakeup is consumed by the call it interrupts; closed is sticky
struct cancellation_token final {
        std::atomic<bool> wakeup{false};
        std::atomic<bool> closed{false};

        bool requested() const noexcept {
                return wakeup.load(std::memory_order_acquire) || closed.load(std::memory_order_acquire);
        }
};

template <typename T>
inline T decode_pod(const uint8_t *&p) noexcept {
        T v;

        memcpy(&v, p, sizeof(T));
        p += sizeof(T);
        return v;
}

namespace SluiceUtil {
        // we need this to guard against races that stem from deferred now_ms updates
        inline constexpr uint64_t time_delta(const uint64_t start, const uint64_t end) {
                return end >= start ? end - start : 0;
        }

        static_assert(time_delta(0, 10) == 10);
        static_assert(time_delta(11, 10) == 0);
} // namespace SluiceUtil
