#include "sluice_consumer.h"
#include "sluice_exceptions.h"

SluiceConsumer::SluiceConsumer(Sluice::BrokerTransport *const t, const consumer_conf &c)
    : conf{c}
    , transport{t}
    , cursors{c.auto_offset_reset, c.max_partition_fetch_bytes}
    , decoder{codecs}
    , resolver{t, c.request_timeout_ms}
    , fetcher{t, cursors, decoder, resolver, conf, cancel}
    , auto_commit{t, cursors, c} {
        conf.validate();

        if (!transport) {
                throw Sluice::config_error("No broker transport");
        }

        for (const auto &name : conf.disabled_codecs) {
                codecs.set_available(Compression::algo_by_name(name), false);
        }
}

SluiceConsumer::~SluiceConsumer() {
        close();
}

void SluiceConsumer::check_open() const {
        if (cancel.closed.load(std::memory_order_acquire)) {
                throw Sluice::consumer_closed();
        }
}

std::vector<topic_partition> SluiceConsumer::resolve_partitions(const std::vector<topic_partition> &partitions) const {
        if (partitions.empty()) {
                return cursors.owned();
        }

        for (const auto &tp : partitions) {
                if (!cursors.is_owned(tp)) {
                        throw Sluice::partition_not_owned(tp);
                }
        }

        return partitions;
}

void SluiceConsumer::on_partitions_assigned(const std::vector<topic_partition> &partitions) {
        static constexpr bool                              trace{false};
        std::vector<topic_partition>                       fresh;
        robin_hood::unordered_map<topic_partition, uint64_t> committed_offsets;

        check_open();

        for (const auto &tp : partitions) {
                if (tp.topic.empty() || tp.topic.size() > Sluice_Limits::max_topic_name_len) {
                        throw Sluice::invalid_argument("Invalid topic name '", tp.topic, "'");
                } else if (!cursors.is_owned(tp) && std::find(fresh.begin(), fresh.end(), tp) == fresh.end()) {
                        fresh.emplace_back(tp);
                }
        }

        if (fresh.empty()) {
                return;
        } else if (cursors.size() + fresh.size() > Sluice_Limits::max_topic_partitions) {
                throw Sluice::invalid_argument("Too many partitions");
        }

        if (!conf.group_id.empty()) {
                for (const auto &[tp, offset] : transport->committed(conf.group_id, fresh, conf.request_timeout_ms)) {
                        committed_offsets.emplace(tp, offset);
                }
        }

        for (const auto &tp : fresh) {
                const auto             it = committed_offsets.find(tp);
                tl::optional<uint64_t> committed;

                if (it != committed_offsets.end()) {
                        committed = it->second;
                }

                if (trace) {
                        SLog("Assigning ", tp, ", committed = ", committed.value_or(0), "/", committed.has_value(), "\n");
                }

                cursors.on_assign(tp, committed, [this](const topic_partition &p, const offset_reset_policy policy) {
                        return resolver.boundary(p, policy);
                });
        }
}

void SluiceConsumer::on_partitions_revoked(const std::vector<topic_partition> &partitions) {
        if (partitions.empty()) {
                return;
        }

        if (auto_commit.active() && !is_closed()) {
                // positions of revoked partitions would otherwise be lost to the next owner
                auto_commit.commit_now(false);
        }

        for (const auto &tp : partitions) {
                cursors.on_revoke(tp);
        }
}

void SluiceConsumer::assign(const std::vector<topic_partition> &partitions) {
        std::vector<topic_partition> revoked;

        check_open();
        for (const auto &tp : cursors.owned()) {
                if (std::find(partitions.begin(), partitions.end(), tp) == partitions.end()) {
                        revoked.emplace_back(tp);
                }
        }

        on_partitions_revoked(revoked);
        on_partitions_assigned(partitions);
}

void SluiceConsumer::unassign() {
        check_open();
        on_partitions_revoked(cursors.owned());
}

std::vector<topic_partition> SluiceConsumer::assignment() const {
        check_open();
        return cursors.owned();
}

void SluiceConsumer::seek(const topic_partition &tp, const uint64_t offset) {
        check_open();
        cursors.seek(tp, offset);
}

void SluiceConsumer::seek_relative(const int64_t delta, const SeekWhence whence, const std::vector<topic_partition> &partitions) {
        static constexpr bool trace{false};

        check_open();

        const auto targets = resolve_partitions(partitions);

        if (targets.empty()) {
                return;
        }

        switch (whence) {
                case SeekWhence::Absolute:
                        if (delta < 0) {
                                throw Sluice::invalid_argument("Negative absolute offset ", delta);
                        }

                        for (const auto &tp : targets) {
                                cursors.seek(tp, delta);
                        }
                        break;

                case SeekWhence::Current: {
                        const auto beginning = resolver.beginning_offsets(targets);

                        for (const auto &tp : targets) {
                                const auto current = static_cast<int64_t>(cursors.get(tp).fetch_offset);
                                const auto first   = static_cast<int64_t>(beginning.find(tp)->second);

                                cursors.seek(tp, std::max(first, current + delta));
                        }
                } break;

                case SeekWhence::Beginning:
                case SeekWhence::End: {
                        // the delta is split evenly (floor division); the remainder goes to the first partitions
                        const auto n         = static_cast<int64_t>(targets.size());
                        auto       per       = delta / n;
                        auto       remainder = delta % n;
                        const auto beginning = resolver.beginning_offsets(targets);
                        const auto end       = whence == SeekWhence::End ? resolver.end_offsets(targets) : beginning;

                        if (remainder < 0) {
                                --per;
                                remainder += n;
                        }

                        for (int64_t i{0}; i < n; ++i) {
                                const auto &tp    = targets[i];
                                const auto  base  = static_cast<int64_t>(end.find(tp)->second);
                                const auto  first = static_cast<int64_t>(beginning.find(tp)->second);
                                const auto  d     = per + (i < remainder ? 1 : 0);
                                // never before the oldest retained message; past the high water mark is left
                                // to the out-of-range handling of the next fetch
                                const auto target = std::max(first, base + d);

                                if (trace) {
                                        SLog("Seeking ", tp, " to ", target, " (", base, " + ", d, ")\n");
                                }

                                cursors.seek(tp, target);
                        }
                } break;
        }
}

void SluiceConsumer::seek_to_beginning(const std::vector<topic_partition> &partitions) {
        seek_relative(0, SeekWhence::Beginning, partitions);
}

void SluiceConsumer::seek_to_end(const std::vector<topic_partition> &partitions) {
        seek_relative(0, SeekWhence::End, partitions);
}

uint64_t SluiceConsumer::position(const topic_partition &tp) const {
        check_open();
        return cursors.get(tp).fetch_offset;
}

tl::optional<uint64_t> SluiceConsumer::committed(const topic_partition &tp) {
        check_open();

        if (conf.group_id.empty()) {
                return tl::nullopt;
        }

        for (const auto &[p, offset] : transport->committed(conf.group_id, {tp}, conf.request_timeout_ms)) {
                if (p == tp) {
                        return offset;
                }
        }

        return tl::nullopt;
}

void SluiceConsumer::commit() {
        check_open();
        auto_commit.commit_now(true);
}

void SluiceConsumer::commit(const Sluice::commit_record &offsets) {
        check_open();
        auto_commit.commit(offsets);
}

uint64_t SluiceConsumer::pending(const std::vector<topic_partition> &partitions) {
        uint64_t res{0};

        check_open();

        const auto targets = resolve_partitions(partitions);

        for (const auto &[tp, end] : resolver.end_offsets(targets)) {
                if (const auto c = cursors.try_get(tp); c && end > c->fetch_offset) {
                        res += end - c->fetch_offset;
                }
        }

        return res;
}

Sluice::OffsetsResolver::resolved_offsets SluiceConsumer::offsets_for_times(const std::vector<std::pair<topic_partition, int64_t>> &targets) {
        check_open();
        return resolver.resolve(targets);
}

robin_hood::unordered_map<topic_partition, uint64_t> SluiceConsumer::beginning_offsets(const std::vector<topic_partition> &partitions) {
        check_open();
        return resolver.beginning_offsets(partitions);
}

robin_hood::unordered_map<topic_partition, uint64_t> SluiceConsumer::end_offsets(const std::vector<topic_partition> &partitions) {
        check_open();
        return resolver.end_offsets(partitions);
}

void SluiceConsumer::close() {
        {
                std::unique_lock<std::mutex> g(wait_lock);

                if (cancel.closed.exchange(true, std::memory_order_acq_rel)) {
                        return;
                }
        }

        wait_cond.notify_all();

        if (auto_commit.active()) {
                // best effort; failures are logged
                auto_commit.commit_now(false);
        }

        cursors.clear();
}
