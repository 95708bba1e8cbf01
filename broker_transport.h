#pragma once
#include "common.h"

namespace Sluice {
        struct consumed_msg final {
                uint64_t    offset;
                int64_t     ts; // milliseconds since the epoch
                std::string key;
                std::string value;
        };

        struct offset_and_timestamp final {
                uint64_t offset;
                int64_t  ts;

                bool operator==(const offset_and_timestamp &o) const noexcept {
                        return offset == o.offset && ts == o.ts;
                }
        };

        // (partition, offset) pairs; for commits, offset is the next offset to consume
        using commit_record = std::vector<std::pair<topic_partition, uint64_t>>;

        // special timestamps for list_offsets(), as in Kafka's ListOffsets API
        namespace ListOffsetsTarget {
                static constexpr int64_t Latest   = -1;
                static constexpr int64_t Earliest = -2;
        } // namespace ListOffsetsTarget

        struct fetch_response final {
                enum class Status : uint8_t {
                        // chunk holds 0+ bundles; the last one may be partial
                        Data = 0,
                        // no data yet (requested offset == high_water_mark)
                        Empty,
                        // the next bundle is larger than max_bytes; see required_size
                        SizeTooSmall,
                        // see first_available and high_water_mark
                        OutOfRange,
                        UnknownPartition,
                } status;

                std::string chunk;
                // offset one past the newest message
                uint64_t high_water_mark{0};
                // offset of the oldest retained message
                uint64_t first_available{0};
                // set if status == SizeTooSmall and the broker knows it; 0 otherwise
                uint64_t required_size{0};
        };

        // The Broker Transport: wire encoding, connections, leaders, retries are all its business.
        // Every call is bounded by the timeout it is given and throws Sluice::timeout_error when it expires.
        // Implementations must be safe to use from multiple threads, because close() may commit from
        // a thread other than the consuming thread.
        class BrokerTransport {
              public:
                virtual ~BrokerTransport() = default;

                virtual fetch_response fetch(const topic_partition &tp, const uint64_t offset, const uint32_t max_bytes, const uint64_t timeout_ms) = 0;

                // throws Sluice::commit_failed or Sluice::timeout_error; the commit applies to all partitions or none
                virtual void commit(const std::string &group_id, const commit_record &record, const uint64_t timeout_ms) = 0;

                // committed offsets of `partitions` for `group_id`; partitions without one are not included
                virtual commit_record committed(const std::string &group_id, const std::vector<topic_partition> &partitions, const uint64_t timeout_ms) = 0;

                // target is a timestamp (>= 0) or one of ListOffsetsTarget
                // returns nullopt for a partition if no message has a timestamp >= target
                virtual std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &targets,
                                                                                                                const uint64_t                                       timeout_ms) = 0;

                // false if the broker can't look up offsets by timestamp (only by ListOffsetsTarget)
                virtual bool supports_timestamp_lookup() const noexcept = 0;
        };
} // namespace Sluice
