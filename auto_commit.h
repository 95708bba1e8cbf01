#pragma once
#include "cursors.h"

namespace Sluice {
        // Persists the cursor table's positions on its own cadence.
        // Driven by the consuming thread at poll boundaries (maybe_commit()), so it never runs concurrently
        // with a poll round; close() may call commit_now() from another thread.
        class AutoCommitScheduler final {
              private:
                BrokerTransport *const transport;
                PartitionCursors &     cursors;
                const std::string      group_id;
                const uint64_t         interval_ms;
                const uint64_t         every_n;
                const uint64_t         request_timeout_ms;
                const bool             enabled;
                // close() may commit from another thread
                std::atomic<uint64_t> last_commit_ms;
                // messages yielded since the last commit round
                std::atomic<uint64_t> consumed{0};

              public:
                struct commit_stats final {
                        std::atomic<uint64_t> rounds{0};
                        std::atomic<uint64_t> skipped{0};
                        std::atomic<uint64_t> failed{0};
                } stats;

                AutoCommitScheduler(BrokerTransport *const t, PartitionCursors &c, const consumer_conf &conf);

                bool active() const noexcept {
                        return enabled;
                }

                void on_consumed(const size_t n) noexcept {
                        consumed.fetch_add(n, std::memory_order_relaxed);
                }

                // true if either trigger fired
                bool due(const uint64_t now_ms) const noexcept;

                // commits if a trigger fired; failures are logged and retried on the next trigger
                void maybe_commit(const uint64_t now_ms);

                // commits a snapshot of the cursor table unless nothing changed since the last commit
                // if propagate is set, failures are thrown (commit_failed or timeout_error), otherwise logged
                // returns true if a commit was issued and succeeded
                bool commit_now(const bool propagate);

                // commits `record` as is; throws on failure
                void commit(const commit_record &record);
        };
} // namespace Sluice
