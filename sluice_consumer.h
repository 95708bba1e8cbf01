#pragma once
#include "auto_commit.h"
#include "fetch_buffers.h"
#include <condition_variable>
#include <exception>

// A consumer of a set of partitions, assigned to it by the application or a group coordinator.
//
// All consumption methods (poll(), next(), get_messages()) are expected to be invoked from a single thread.
// assign()/on_partitions_*(), seek*(), wakeup() and close() may be invoked from any thread.
//
// Delivery is at-least-once: positions are committed after messages are returned, so after a restart
// messages returned but not yet committed are returned again.
class SluiceConsumer final {
      public:
        struct partition_content final {
                topic_partition                   tp;
                std::vector<Sluice::consumed_msg> msgs;
        };

        struct consumer_record final {
                topic_partition      tp;
                Sluice::consumed_msg msg;
        };

        enum class SeekWhence : uint8_t {
                // the offset itself, for every partition
                Absolute = 0,
                // relative to the current position of each partition
                Current,
                // relative to the oldest retained message; the delta is distributed across partitions
                Beginning,
                // relative to the high water mark; the delta is distributed across partitions
                End,
        };

      private:
        // messages fetched but not yet returned; accessed by the consuming thread only
        struct buffered_batch final {
                uint64_t                          generation;
                std::vector<Sluice::consumed_msg> msgs;
                size_t                            idx;
        };

        const consumer_conf                 conf;
        Sluice::BrokerTransport *const      transport;
        Compression::CodecRegistry          codecs;
        Sluice::PartitionCursors            cursors;
        Sluice::MessageDecoder              decoder;
        Sluice::OffsetsResolver             resolver;
        cancellation_token                  cancel;
        Sluice::FetchBufferManager          fetcher;
        Sluice::AutoCommitScheduler         auto_commit;
        std::mutex                          wait_lock;
        std::condition_variable             wait_cond;
        robin_hood::unordered_map<topic_partition, buffered_batch> buffered;
        // round-robin start
        size_t next_start{0};
        // a fault raised after messages were collected; thrown by the next consumption call
        std::exception_ptr deferred_fault;

        void check_open() const;

        // one pass over the owned partitions; returns the number of messages collected
        size_t poll_round(const size_t max_records, std::vector<partition_content> *out);

        std::vector<partition_content> poll_impl(const uint64_t timeout_ms, const size_t max_records, const bool until_full);

        void idle_wait(const uint64_t deadline);

        std::vector<topic_partition> resolve_partitions(const std::vector<topic_partition> &partitions) const;

      public:
        // throws Sluice::config_error, or Sluice::unsupported_codec
        SluiceConsumer(Sluice::BrokerTransport *const t, const consumer_conf &c);

        ~SluiceConsumer();

        const consumer_conf &config() const noexcept {
                return conf;
        }

        Compression::CodecRegistry &codec_registry() noexcept {
                return codecs;
        }

        const Sluice::AutoCommitScheduler &auto_committer() const noexcept {
                return auto_commit;
        }

        // replaces the current assignment
        void assign(const std::vector<topic_partition> &partitions);

        void unassign();

        std::vector<topic_partition> assignment() const;

        // Group Coordinator callbacks
        //
        // new partitions start from their committed offset, or according to auto_offset_reset
        // throws Sluice::offset_reset_required
        void on_partitions_assigned(const std::vector<topic_partition> &partitions);

        // commits (if auto-commit is enabled) before the partitions are dropped
        void on_partitions_revoked(const std::vector<topic_partition> &partitions);

        // throws Sluice::partition_not_owned
        void seek(const topic_partition &tp, const uint64_t offset);

        // an empty `partitions` applies to all assigned partitions
        void seek_relative(const int64_t delta, const SeekWhence whence, const std::vector<topic_partition> &partitions = {});

        void seek_to_beginning(const std::vector<topic_partition> &partitions = {});

        void seek_to_end(const std::vector<topic_partition> &partitions = {});

        // offset of the next message to be returned
        uint64_t position(const topic_partition &tp) const;

        // last committed offset of tp for this group
        tl::optional<uint64_t> committed(const topic_partition &tp);

        // blocks until at least one message is available, or timeout_ms elapses
        // max_records 0 for conf.max_poll_records
        std::vector<partition_content> poll(const uint64_t timeout_ms, const size_t max_records = 0);

        // blocks for up to consumer_timeout_ms; false if no message became available
        bool next(consumer_record *out);

        // up to count messages. If block is set, blocks until count messages are collected or timeout_ms elapses,
        // otherwise returns whatever is available now
        std::vector<consumer_record> get_messages(const size_t count, const bool block, const uint64_t timeout_ms);

        // commits the current positions of all assigned partitions
        // throws Sluice::commit_failed or Sluice::timeout_error
        void commit();

        void commit(const Sluice::commit_record &offsets);

        // messages past the current position, up to the high water mark
        uint64_t pending(const std::vector<topic_partition> &partitions = {});

        Sluice::OffsetsResolver::resolved_offsets offsets_for_times(const std::vector<std::pair<topic_partition, int64_t>> &targets);

        robin_hood::unordered_map<topic_partition, uint64_t> beginning_offsets(const std::vector<topic_partition> &partitions);

        robin_hood::unordered_map<topic_partition, uint64_t> end_offsets(const std::vector<topic_partition> &partitions);

        // interrupts a blocking consumption call (from any thread)
        // the interrupted call returns what it has collected so far
        void wakeup();

        // interrupts a blocking call, commits (best effort) and drops all partitions
        // any further call throws Sluice::consumer_closed
        void close();

        bool is_closed() const noexcept {
                return cancel.closed.load(std::memory_order_acquire);
        }
};
