#include "auto_commit.h"
#include "sluice_exceptions.h"

using namespace Sluice;

AutoCommitScheduler::AutoCommitScheduler(BrokerTransport *const t, PartitionCursors &c, const consumer_conf &conf)
    : transport{t}
    , cursors{c}
    , group_id{conf.group_id}
    , interval_ms{conf.auto_commit_interval_ms}
    , every_n{conf.auto_commit_every_n}
    , request_timeout_ms{conf.request_timeout_ms}
    , enabled{conf.enable_auto_commit && !conf.group_id.empty() && (conf.auto_commit_interval_ms || conf.auto_commit_every_n)}
    , last_commit_ms{Timings::Milliseconds::Tick()} {
}

bool AutoCommitScheduler::due(const uint64_t now_ms) const noexcept {
        if (!enabled) {
                return false;
        } else if (interval_ms && SluiceUtil::time_delta(last_commit_ms.load(std::memory_order_relaxed), now_ms) >= interval_ms) {
                return true;
        } else if (every_n && consumed.load(std::memory_order_relaxed) >= every_n) {
                return true;
        } else {
                return false;
        }
}

void AutoCommitScheduler::maybe_commit(const uint64_t now_ms) {
        if (due(now_ms)) {
                commit_now(false);
        }
}

bool AutoCommitScheduler::commit_now(const bool propagate) {
        static constexpr bool trace{false};

        if (group_id.empty()) {
                if (propagate) {
                        throw commit_failed("Unable to commit offsets: no group_id configured");
                }

                return false;
        }

        // both triggers restart whether the round succeeds or not; a failure is retried on the next trigger
        last_commit_ms.store(Timings::Milliseconds::Tick(), std::memory_order_relaxed);
        consumed.store(0, std::memory_order_relaxed);

        if (!cursors.any_uncommitted()) {
                if (trace) {
                        SLog("Nothing to commit\n");
                }

                ++stats.skipped;
                return false;
        }

        const auto record = cursors.snapshot_committable();

        if (record.empty()) {
                ++stats.skipped;
                return false;
        }

        if (trace) {
                SLog("Committing ", record.size(), " partitions for ", group_id, "\n");
        }

        try {
                transport->commit(group_id, record, request_timeout_ms);
        } catch (const commit_failed &e) {
                ++stats.failed;
                if (propagate) {
                        throw;
                }

                SLog(ansifmt::color_red, "Failed to commit offsets of ", record.size(), " partitions: ", e.what(), ansifmt::reset, "\n");
                return false;
        } catch (const timeout_error &e) {
                ++stats.failed;
                if (propagate) {
                        throw;
                }

                SLog(ansifmt::color_red, "Timed out committing offsets of ", record.size(), " partitions: ", e.what(), ansifmt::reset, "\n");
                return false;
        }

        cursors.mark_committed(record);
        ++stats.rounds;
        return true;
}

void AutoCommitScheduler::commit(const commit_record &record) {
        if (group_id.empty()) {
                throw commit_failed("Unable to commit offsets: no group_id configured");
        } else if (record.empty()) {
                return;
        }

        transport->commit(group_id, record, request_timeout_ms);
        cursors.mark_committed(record);
}
