#pragma once
#include "broker_transport.h"
#include "compress.h"
#include <map>
#include <mutex>

// An in-memory BrokerTransport over partition logs, for tests.
//
// A partition log is a list of bundles, each holding one or more messages. Fetches return whole
// bundles starting at the bundle that holds the requested offset, up to max_bytes; if the first bundle
// doesn't fit, the broker either returns it truncated (the default) or a SizeTooSmall status.
class TestBroker final
    : public Sluice::BrokerTransport {
      public:
        enum class OversizeMode : uint8_t {
                Truncate = 0,
                SizeTooSmall,
                // SizeTooSmall, without the required size
                SizeTooSmallUnknown,
        };

      private:
        struct stored_bundle final {
                uint64_t    first_offset;
                uint64_t    last_offset;
                int64_t     first_ts;
                std::string encoded;
        };

        struct partition_log final {
                std::vector<stored_bundle> bundles;
                // one past the newest message
                uint64_t next_offset{0};
                // oldest retained
                uint64_t first_available{0};
        };

        mutable std::mutex                                             lock;
        std::map<topic_partition, partition_log>                       logs;
        std::map<std::string, std::map<topic_partition, uint64_t>> commits;

      public:
        OversizeMode oversize_mode{OversizeMode::Truncate};
        bool         timestamp_lookup{true};
        bool         fail_commits{false};

        struct counters final {
                size_t fetch{0};
                size_t commit{0};
                size_t committed{0};
                size_t list_offsets{0};
        } calls;

        // creates an empty partition
        void create(const topic_partition &tp);

        // appends one bundle; returns the offset of the first message
        uint64_t produce(const topic_partition &tp, const std::vector<std::string> &values,
                         const Compression::Algo codec = Compression::Algo::NONE, const int64_t ts = 0, const std::string &key = {});

        // appends one message per value, each in its own bundle
        void produce_each(const topic_partition &tp, const std::vector<std::string> &values, const int64_t ts = 0);

        // appends raw bytes as a bundle; used to inject corrupt content
        void produce_raw(const topic_partition &tp, const std::string &bundle, const uint64_t msgs_cnt);

        // skips `n` offsets; the next message is produced at next_offset + n
        void skip_offsets(const topic_partition &tp, const uint64_t n);

        // drops bundles whose messages are all below `offset`
        void truncate_head(const topic_partition &tp, const uint64_t offset);

        uint64_t high_water_mark(const topic_partition &tp) const;

        tl::optional<uint64_t> committed_offset(const std::string &group, const topic_partition &tp) const;

        Sluice::fetch_response fetch(const topic_partition &tp, const uint64_t offset, const uint32_t max_bytes, const uint64_t timeout_ms) override;

        void commit(const std::string &group_id, const Sluice::commit_record &record, const uint64_t timeout_ms) override;

        Sluice::commit_record committed(const std::string &group_id, const std::vector<topic_partition> &partitions, const uint64_t timeout_ms) override;

        std::vector<std::pair<topic_partition, tl::optional<Sluice::offset_and_timestamp>>> list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &targets,
                                                                                                        const uint64_t                                       timeout_ms) override;

        bool supports_timestamp_lookup() const noexcept override {
                return timestamp_lookup;
        }
};
