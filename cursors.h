#pragma once
#include "broker_transport.h"
#include "consumer_conf.h"
#include <mutex>

namespace Sluice {
        struct partition_cursor final {
                // next offset to request
                uint64_t fetch_offset{0};
                // highest offset yielded to the caller
                tl::optional<uint64_t> last_returned_offset;
                // last durably acknowledged offset (next offset to consume)
                tl::optional<uint64_t> committed_offset;
                uint64_t               fetch_buffer_size{0};
                // advisory; as reported by the last fetch
                uint64_t high_water_mark{0};
                // bumped whenever the position is set from outside the fetch path (seek, assignment)
                // anything buffered for an older generation is stale
                uint64_t generation{0};
                // consecutive fetches that fit in the default buffer size, see FetchBufferManager
                uint32_t fits_default_run{0};
                // set after a repeated out-of-range fault; cleared by seek()
                bool failed{false};
        };

        // one entry of a FetchRequestPlan
        struct fetch_plan_entry final {
                topic_partition tp;
                uint64_t        fetch_offset;
                uint64_t        fetch_buffer_size;
                uint64_t        generation;
        };

        using fetch_plan = std::vector<fetch_plan_entry>;

        // The PartitionCursor table; the only shared mutable state of a consumer.
        //
        // Every method is serialized by a single lock, which is never held across a network call.
        // Methods that take a generation are compare-and-set: they do nothing (and return false)
        // if the cursor was repositioned or reassigned since that generation was observed.
        class PartitionCursors final {
              public:
                // resolves the initial offset of a partition that has no committed offset
                using boundary_lookup = std::function<uint64_t(const topic_partition &, const offset_reset_policy)>;

              private:
                mutable std::mutex                                       lock;
                robin_hood::unordered_map<topic_partition, partition_cursor> cursors;
                // in assignment order; used for round-robin
                std::vector<topic_partition> order;
                uint64_t                     next_generation{1};
                const offset_reset_policy    reset_policy;
                const uint64_t               default_fetch_buffer_size;

              public:
                PartitionCursors(const offset_reset_policy policy, const uint64_t default_buffer_size)
                    : reset_policy{policy}
                    , default_fetch_buffer_size{default_buffer_size} {
                }

                // throws partition_not_owned
                partition_cursor get(const topic_partition &tp) const;

                tl::optional<partition_cursor> try_get(const topic_partition &tp) const;

                bool is_owned(const topic_partition &tp) const;

                std::vector<topic_partition> owned() const;

                size_t size() const;

                // repositions the cursor; bumps the generation and clears the failed flag
                void set_fetch_offset(const topic_partition &tp, const uint64_t offset);

                // sets last_returned_offset and fetch_offset = offset + 1
                bool advance(const topic_partition &tp, const uint64_t generation, const uint64_t offset);

                void advance(const topic_partition &tp, const uint64_t offset);

                // absolute reposition, as requested by the application; invalidates anything buffered for the partition
                void seek(const topic_partition &tp, const uint64_t offset);

                // repositions without invalidating the generation; used by the fetch path itself
                // when it resolves an out-of-range fault
                bool reset_position(const topic_partition &tp, const uint64_t generation, const uint64_t offset);

                bool set_fetch_buffer_size(const topic_partition &tp, const uint64_t generation, const uint64_t size, const uint32_t fits_default_run);

                bool set_high_water_mark(const topic_partition &tp, const uint64_t generation, const uint64_t hwm);

                bool mark_failed(const topic_partition &tp, const uint64_t generation);

                // (partition, fetch_offset) for every owned partition
                commit_record snapshot_committable() const;

                // true if any owned partition's position differs from its committed offset
                bool any_uncommitted() const;

                // for partitions still owned
                void mark_committed(const commit_record &record);

                // partitions that are not failed, starting from the `start`th owned partition
                fetch_plan plan(const size_t start) const;

                void on_revoke(const topic_partition &tp);

                // creates the cursor, if not already owned. The initial offset is `committed` if set,
                // otherwise it is resolved with `lookup` according to the reset policy.
                // throws offset_reset_required if neither is possible
                void on_assign(const topic_partition &tp, const tl::optional<uint64_t> committed, const boundary_lookup &lookup);

                void clear();
        };
} // namespace Sluice
