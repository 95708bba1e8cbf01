#include "sluice_consumer.h"
#include "sluice_exceptions.h"

size_t SluiceConsumer::poll_round(const size_t max_records, std::vector<partition_content> *out) {
        static constexpr bool trace{false};
        const auto            plan = cursors.plan(next_start++);
        uint64_t              fetched_bytes{0};
        size_t                collected{0};

        if (trace) {
                SLog("Round over ", plan.size(), " partitions, max_records = ", max_records, "\n");
        }

        DEFER({
                // drop empty entries (generation changed before anything was returned)
                out->erase(std::remove_if(out->begin(), out->end(), [](const auto &c) { return c.msgs.empty(); }), out->end());
                auto_commit.on_consumed(collected);
        });

        // drop what's buffered for partitions we no longer fetch from
        for (auto it = buffered.begin(); it != buffered.end();) {
                if (std::find_if(plan.begin(), plan.end(), [&](const auto &e) { return e.tp == it->first; }) == plan.end()) {
                        it = buffered.erase(it);
                } else {
                        ++it;
                }
        }

        for (const auto &e : plan) {
                if (collected == max_records || cancel.requested()) {
                        break;
                }

                auto it = buffered.find(e.tp);

                if (it != buffered.end() && (it->second.generation != e.generation || it->second.idx == it->second.msgs.size())) {
                        // stale (seek or reassignment since it was fetched), or drained
                        if (trace && it->second.generation != e.generation) {
                                SLog("Discarding ", it->second.msgs.size() - it->second.idx, " buffered messages of ", e.tp, "\n");
                        }

                        buffered.erase(it);
                        it = buffered.end();
                }

                if (it == buffered.end()) {
                        // the first fetch of a round is always issued, so that a partition whose buffer
                        // exceeds fetch_max_bytes still makes progress
                        if (fetched_bytes && fetched_bytes + e.fetch_buffer_size > conf.fetch_max_bytes) {
                                if (trace) {
                                        SLog("Skipping ", e.tp, ": fetch_max_bytes reached (", size_repr(fetched_bytes), ")\n");
                                }

                                continue;
                        }

                        auto batch = fetcher.fetch(e);

                        if (!batch) {
                                continue;
                        }

                        fetched_bytes += batch->chunk_size;
                        it = buffered.emplace(e.tp, buffered_batch{
                                                        .generation = e.generation,
                                                        .msgs       = std::move(batch->msgs),
                                                        .idx        = 0,
                                                    })
                                 .first;
                }

                auto &b = it->second;
                auto  n = std::min(b.msgs.size() - b.idx, max_records - collected);

                if (!n) {
                        continue;
                }

                partition_content *content;

                if (auto cit = std::find_if(out->begin(), out->end(), [&](const auto &c) { return c.tp == e.tp; }); cit != out->end()) {
                        content = &*cit;
                } else {
                        content = &out->emplace_back(partition_content{.tp = e.tp, .msgs = {}});
                }

                for (; n; --n) {
                        auto &m = b.msgs[b.idx];

                        if (!cursors.advance(e.tp, e.generation, m.offset)) {
                                // repositioned or revoked while we were draining
                                b.idx = b.msgs.size();
                                break;
                        }

                        content->msgs.emplace_back(std::move(m));
                        ++b.idx;
                        ++collected;
                }
        }

        return collected;
}

void SluiceConsumer::idle_wait(const uint64_t deadline) {
        const auto now = Timings::Milliseconds::Tick();

        if (now >= deadline) {
                return;
        }

        std::unique_lock<std::mutex> g(wait_lock);

        wait_cond.wait_for(g, std::chrono::milliseconds(std::min<uint64_t>(conf.poll_granularity_ms, deadline - now)),
                           [this]() { return cancel.requested(); });
}

std::vector<SluiceConsumer::partition_content> SluiceConsumer::poll_impl(const uint64_t timeout_ms, const size_t max_records, const bool until_full) {
        static constexpr bool          trace{false};
        const auto                     start    = Timings::Milliseconds::Tick();
        // saturates; a huge timeout blocks until there is something to return
        const auto                     deadline = timeout_ms > std::numeric_limits<uint64_t>::max() - start ? std::numeric_limits<uint64_t>::max() : start + timeout_ms;
        std::vector<partition_content> res;
        size_t                         collected{0};

        check_open();

        // at the boundary of each call, so that the trigger covers everything returned by previous calls
        auto_commit.maybe_commit(start);

        if (deferred_fault) {
                auto e = std::move(deferred_fault);

                deferred_fault = nullptr;
                std::rethrow_exception(e);
        }

        for (;;) {
                try {
                        collected += poll_round(max_records - collected, &res);
                } catch (const std::exception &e) {
                        collected = 0;
                        for (const auto &it : res) {
                                collected += it.msgs.size();
                        }

                        if (!collected) {
                                throw;
                        }

                        // messages collected are already accounted for in the cursors; return them first
                        if (trace) {
                                SLog("Deferring fault (", e.what(), ") after ", collected, " messages\n");
                        }

                        deferred_fault = std::current_exception();
                        break;
                }

                if (collected == max_records || (collected && !until_full)) {
                        break;
                } else if (cancel.closed.load(std::memory_order_acquire)) {
                        break;
                } else if (cancel.wakeup.exchange(false, std::memory_order_acq_rel)) {
                        if (trace) {
                                SLog("Woken up\n");
                        }

                        break;
                } else if (Timings::Milliseconds::Tick() >= deadline) {
                        break;
                }

                idle_wait(deadline);
        }

        if (trace) {
                SLog("Collected ", collected, " in ", Timings::Milliseconds::Since(start), "ms\n");
        }

        return res;
}

std::vector<SluiceConsumer::partition_content> SluiceConsumer::poll(const uint64_t timeout_ms, const size_t max_records) {
        return poll_impl(timeout_ms, max_records ? max_records : conf.max_poll_records, false);
}

bool SluiceConsumer::next(consumer_record *out) {
        auto res = poll_impl(conf.consumer_timeout_ms, 1, false);

        if (res.empty()) {
                return false;
        }

        auto &content = res.front();

        SLUICE_EXPECT(content.msgs.size() == 1);
        out->tp  = std::move(content.tp);
        out->msg = std::move(content.msgs.front());
        return true;
}

std::vector<SluiceConsumer::consumer_record> SluiceConsumer::get_messages(const size_t count, const bool block, const uint64_t timeout_ms) {
        std::vector<consumer_record> res;

        if (!count) {
                return res;
        }

        for (auto &content : poll_impl(block ? timeout_ms : 0, count, block)) {
                for (auto &m : content.msgs) {
                        res.push_back({.tp = content.tp, .msg = std::move(m)});
                }
        }

        return res;
}

void SluiceConsumer::wakeup() {
        {
                std::unique_lock<std::mutex> g(wait_lock);

                cancel.wakeup.store(true, std::memory_order_release);
        }

        wait_cond.notify_all();
}
