#pragma once
#include "common.h"
#include <string_view>

enum class offset_reset_policy : uint8_t {
        Earliest = 0,
        Latest,
        Fail,
};

inline void PrintImpl(std::string &out, const offset_reset_policy p) {
        switch (p) {
                case offset_reset_policy::Earliest:
                        out.append("earliest");
                        break;
                case offset_reset_policy::Latest:
                        out.append("latest");
                        break;
                case offset_reset_policy::Fail:
                        out.append("fail");
                        break;
        }
}

struct consumer_conf final {
        // empty: no group, i.e offsets are neither loaded nor committed
        std::string group_id;

        // where to start from when there is no committed offset for a partition
        offset_reset_policy auto_offset_reset{offset_reset_policy::Latest};

        // if set, an out-of-range fetch repositions the cursor according to auto_offset_reset (once)
        // instead of failing; ignored if auto_offset_reset is Fail
        bool reset_offset_on_out_of_range{true};

        bool     enable_auto_commit{true};
        uint64_t auto_commit_interval_ms{5000}; // 0: disabled
        uint64_t auto_commit_every_n{0};        // 0: disabled

        // upper bound of bytes fetched in one poll round, across all partitions
        uint64_t fetch_max_bytes{50 * 1024 * 1024};
        // initial (and default) per-partition fetch buffer size
        uint32_t max_partition_fetch_bytes{1024 * 1024};
        // per-partition fetch buffers never grow past that; 0 for unbounded
        uint64_t max_buffer_size{8 * 1024 * 1024};
        // shrink a grown buffer back to max_partition_fetch_bytes after that many fetches that fit in it; 0 never shrinks
        uint32_t buffer_shrink_after{16};

        uint64_t consumer_timeout_ms{30 * 1000};
        uint64_t request_timeout_ms{30 * 1000};
        uint32_t max_poll_records{500};
        uint32_t poll_granularity_ms{50};

        std::vector<std::string> disabled_codecs;

        // throws Sluice::config_error
        void validate() const;

        // Parses a JSON object, e.g
        // { "group_id": "orders", "auto_offset_reset": "earliest", "auto_commit_interval_ms": 100 }
        // unknown keys are ignored; bogus values throw Sluice::config_error
        static consumer_conf from_json(const std::string_view content);
};
