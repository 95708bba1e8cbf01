#include "cursors.h"
#include "sluice_exceptions.h"

using namespace Sluice;

partition_cursor PartitionCursors::get(const topic_partition &tp) const {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end()) {
                throw partition_not_owned(tp);
        }

        return it->second;
}

tl::optional<partition_cursor> PartitionCursors::try_get(const topic_partition &tp) const {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end()) {
                return tl::nullopt;
        }

        return it->second;
}

bool PartitionCursors::is_owned(const topic_partition &tp) const {
        std::unique_lock<std::mutex> g(lock);

        return cursors.count(tp);
}

std::vector<topic_partition> PartitionCursors::owned() const {
        std::unique_lock<std::mutex> g(lock);

        return order;
}

size_t PartitionCursors::size() const {
        std::unique_lock<std::mutex> g(lock);

        return order.size();
}

void PartitionCursors::set_fetch_offset(const topic_partition &tp, const uint64_t offset) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end()) {
                throw partition_not_owned(tp);
        }

        auto &c = it->second;

        c.fetch_offset = offset;
        c.failed       = false;
        c.generation   = next_generation++;
}

bool PartitionCursors::advance(const topic_partition &tp, const uint64_t generation, const uint64_t offset) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end() || it->second.generation != generation) {
                return false;
        }

        auto &c = it->second;

        c.last_returned_offset = offset;
        c.fetch_offset         = offset + 1;

        SLUICE_EXPECT(c.fetch_offset >= *c.last_returned_offset + 1);
        return true;
}

void PartitionCursors::advance(const topic_partition &tp, const uint64_t offset) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end()) {
                throw partition_not_owned(tp);
        }

        it->second.last_returned_offset = offset;
        it->second.fetch_offset         = offset + 1;
}

void PartitionCursors::seek(const topic_partition &tp, const uint64_t offset) {
        static constexpr bool trace{false};

        if (trace) {
                SLog("Seek ", tp, " => ", offset, "\n");
        }

        set_fetch_offset(tp, offset);
}

bool PartitionCursors::reset_position(const topic_partition &tp, const uint64_t generation, const uint64_t offset) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end() || it->second.generation != generation) {
                return false;
        }

        it->second.fetch_offset = offset;
        return true;
}

bool PartitionCursors::set_fetch_buffer_size(const topic_partition &tp, const uint64_t generation, const uint64_t size, const uint32_t fits_default_run) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end() || it->second.generation != generation) {
                return false;
        }

        it->second.fetch_buffer_size = size;
        it->second.fits_default_run  = fits_default_run;
        return true;
}

bool PartitionCursors::set_high_water_mark(const topic_partition &tp, const uint64_t generation, const uint64_t hwm) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end() || it->second.generation != generation) {
                return false;
        }

        it->second.high_water_mark = hwm;
        return true;
}

bool PartitionCursors::mark_failed(const topic_partition &tp, const uint64_t generation) {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = cursors.find(tp);

        if (it == cursors.end() || it->second.generation != generation) {
                return false;
        }

        it->second.failed = true;
        return true;
}

commit_record PartitionCursors::snapshot_committable() const {
        std::unique_lock<std::mutex> g(lock);
        commit_record                res;

        res.reserve(order.size());
        for (const auto &tp : order) {
                res.emplace_back(tp, cursors.find(tp)->second.fetch_offset);
        }

        return res;
}

bool PartitionCursors::any_uncommitted() const {
        std::unique_lock<std::mutex> g(lock);

        for (const auto &it : cursors) {
                const auto &c = it.second;

                if (!c.committed_offset || *c.committed_offset != c.fetch_offset) {
                        return true;
                }
        }

        return false;
}

void PartitionCursors::mark_committed(const commit_record &record) {
        std::unique_lock<std::mutex> g(lock);

        for (const auto &[tp, offset] : record) {
                // may have been revoked while the commit was in flight
                if (auto it = cursors.find(tp); it != cursors.end()) {
                        it->second.committed_offset = offset;
                }
        }
}

fetch_plan PartitionCursors::plan(const size_t start) const {
        std::unique_lock<std::mutex>  g(lock);
        fetch_plan                    res;
        const auto                    n = order.size();

        res.reserve(n);
        for (size_t i{0}; i < n; ++i) {
                const auto &tp = order[(start + i) % n];
                const auto &c  = cursors.find(tp)->second;

                if (c.failed) {
                        continue;
                }

                res.push_back({
                    .tp                = tp,
                    .fetch_offset      = c.fetch_offset,
                    .fetch_buffer_size = c.fetch_buffer_size,
                    .generation        = c.generation,
                });
        }

        return res;
}

void PartitionCursors::on_revoke(const topic_partition &tp) {
        std::unique_lock<std::mutex> g(lock);

        if (cursors.erase(tp)) {
                order.erase(std::remove(order.begin(), order.end(), tp), order.end());
        }
}

void PartitionCursors::on_assign(const topic_partition &tp, const tl::optional<uint64_t> committed, const boundary_lookup &lookup) {
        static constexpr bool trace{false};
        uint64_t              initial;

        if (is_owned(tp)) {
                return;
        }

        if (committed) {
                initial = *committed;
        } else if (reset_policy == offset_reset_policy::Fail) {
                throw offset_reset_required(tp);
        } else {
                // may block; the lock is not held
                initial = lookup(tp, reset_policy);
        }

        if (trace) {
                SLog("Assigned ", tp, " at ", initial, " (committed:", committed.has_value(), ")\n");
        }

        std::unique_lock<std::mutex> g(lock);
        auto [it, inserted] = cursors.emplace(tp, partition_cursor{});

        if (!inserted) {
                // assigned concurrently
                return;
        }

        auto &c = it->second;

        c.fetch_offset      = initial;
        c.committed_offset  = committed;
        c.fetch_buffer_size = default_fetch_buffer_size;
        c.generation        = next_generation++;
        order.emplace_back(tp);
}

void PartitionCursors::clear() {
        std::unique_lock<std::mutex> g(lock);

        cursors.clear();
        order.clear();
}
