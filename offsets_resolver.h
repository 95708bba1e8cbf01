#pragma once
#include "broker_transport.h"
#include "consumer_conf.h"

namespace Sluice {
        // Timestamp to offset resolution, and partition boundaries, against the broker.
        // Stateless apart from its collaborators; it never touches cursor state.
        class OffsetsResolver final {
              public:
                using resolved_offsets = robin_hood::unordered_map<topic_partition, tl::optional<offset_and_timestamp>>;

              private:
                BrokerTransport *const transport;
                const uint64_t         request_timeout_ms;

                std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &);

                robin_hood::unordered_map<topic_partition, uint64_t> boundaries(const std::vector<topic_partition> &, const int64_t target);

              public:
                OffsetsResolver(BrokerTransport *const t, const uint64_t timeout_ms)
                    : transport{t}
                    , request_timeout_ms{timeout_ms} {
                }

                // per partition, the earliest message with ts >= target, or nullopt if there is none
                // throws invalid_argument (before any network call) for negative targets,
                // unsupported_version if the broker can't look up offsets by timestamp,
                // timeout_error if the broker doesn't respond for any of the partitions
                resolved_offsets resolve(const std::vector<std::pair<topic_partition, int64_t>> &targets);

                // offset of the oldest retained message
                robin_hood::unordered_map<topic_partition, uint64_t> beginning_offsets(const std::vector<topic_partition> &partitions);

                // one past the newest message
                robin_hood::unordered_map<topic_partition, uint64_t> end_offsets(const std::vector<topic_partition> &partitions);

                // the boundary an offset reset policy resolves to; policy must not be Fail
                uint64_t boundary(const topic_partition &tp, const offset_reset_policy policy);
        };
} // namespace Sluice
