#include "test_broker.h"
#include "msg_decoder.h"
#include "sluice_exceptions.h"

void TestBroker::create(const topic_partition &tp) {
        std::unique_lock<std::mutex> g(lock);

        logs[tp];
}

uint64_t TestBroker::produce(const topic_partition &tp, const std::vector<std::string> &values,
                             const Compression::Algo codec, const int64_t ts, const std::string &key) {
        std::unique_lock<std::mutex> g(lock);
        auto &                       log  = logs[tp];
        const auto                   base = log.next_offset;
        std::vector<Sluice::consumed_msg> msgs;
        stored_bundle                b;

        if (values.empty()) {
                throw Sluice::invalid_argument("No messages to produce");
        }

        for (const auto &v : values) {
                msgs.push_back({.offset = log.next_offset++, .ts = ts, .key = key, .value = v});
        }

        Sluice::encode_bundle(&b.encoded, codec, base, msgs);
        b.first_offset = base;
        b.last_offset  = log.next_offset - 1;
        b.first_ts     = ts;
        log.bundles.emplace_back(std::move(b));
        return base;
}

void TestBroker::produce_each(const topic_partition &tp, const std::vector<std::string> &values, const int64_t ts) {
        for (const auto &v : values) {
                produce(tp, {v}, Compression::Algo::NONE, ts);
        }
}

void TestBroker::produce_raw(const topic_partition &tp, const std::string &bundle, const uint64_t msgs_cnt) {
        std::unique_lock<std::mutex> g(lock);
        auto &                       log = logs[tp];
        stored_bundle                b;

        b.first_offset = log.next_offset;
        log.next_offset += msgs_cnt;
        b.last_offset = log.next_offset - 1;
        b.first_ts    = 0;
        b.encoded     = bundle;
        log.bundles.emplace_back(std::move(b));
}

void TestBroker::skip_offsets(const topic_partition &tp, const uint64_t n) {
        std::unique_lock<std::mutex> g(lock);

        logs[tp].next_offset += n;
}

void TestBroker::truncate_head(const topic_partition &tp, const uint64_t offset) {
        std::unique_lock<std::mutex> g(lock);
        auto &                       log = logs[tp];
        auto                         it  = log.bundles.begin();

        while (it != log.bundles.end() && it->last_offset < offset) {
                ++it;
        }

        log.bundles.erase(log.bundles.begin(), it);
        log.first_available = log.bundles.empty() ? log.next_offset : log.bundles.front().first_offset;
}

uint64_t TestBroker::high_water_mark(const topic_partition &tp) const {
        std::unique_lock<std::mutex> g(lock);
        const auto                   it = logs.find(tp);

        return it == logs.end() ? 0 : it->second.next_offset;
}

tl::optional<uint64_t> TestBroker::committed_offset(const std::string &group, const topic_partition &tp) const {
        std::unique_lock<std::mutex> g(lock);

        if (const auto it = commits.find(group); it != commits.end()) {
                if (const auto pit = it->second.find(tp); pit != it->second.end()) {
                        return pit->second;
                }
        }

        return tl::nullopt;
}

Sluice::fetch_response TestBroker::fetch(const topic_partition &tp, const uint64_t offset, const uint32_t max_bytes, const uint64_t) {
        std::unique_lock<std::mutex> g(lock);
        Sluice::fetch_response       res;
        const auto                   it = logs.find(tp);

        ++calls.fetch;
        if (it == logs.end()) {
                res.status = Sluice::fetch_response::Status::UnknownPartition;
                return res;
        }

        const auto &log = it->second;

        res.high_water_mark = log.next_offset;
        res.first_available = log.first_available;

        if (offset < log.first_available || offset > log.next_offset) {
                res.status = Sluice::fetch_response::Status::OutOfRange;
                return res;
        }

        auto bit = std::find_if(log.bundles.begin(), log.bundles.end(), [offset](const auto &b) { return b.last_offset >= offset; });

        if (bit == log.bundles.end()) {
                // at the high water mark, or in a gap past the last bundle
                res.status = Sluice::fetch_response::Status::Empty;
                return res;
        }

        if (bit->encoded.size() > max_bytes) {
                switch (oversize_mode) {
                        case OversizeMode::Truncate:
                                res.status = Sluice::fetch_response::Status::Data;
                                res.chunk.assign(bit->encoded.data(), max_bytes);
                                break;

                        case OversizeMode::SizeTooSmall:
                                res.status        = Sluice::fetch_response::Status::SizeTooSmall;
                                res.required_size = bit->encoded.size();
                                break;

                        case OversizeMode::SizeTooSmallUnknown:
                                res.status = Sluice::fetch_response::Status::SizeTooSmall;
                                break;
                }

                return res;
        }

        res.status = Sluice::fetch_response::Status::Data;
        for (; bit != log.bundles.end() && res.chunk.size() + bit->encoded.size() <= max_bytes; ++bit) {
                res.chunk.append(bit->encoded);
        }

        return res;
}

void TestBroker::commit(const std::string &group_id, const Sluice::commit_record &record, const uint64_t timeout_ms) {
        std::unique_lock<std::mutex> g(lock);

        ++calls.commit;
        if (fail_commits) {
                throw Sluice::commit_failed("Commit of ", record.size(), " partitions for ", group_id, " rejected");
        }

        for (const auto &[tp, offset] : record) {
                if (!logs.count(tp)) {
                        throw Sluice::timeout_error("Commit for unknown partition ", tp, " timed out after ", timeout_ms, "ms");
                }
        }

        auto &m = commits[group_id];

        for (const auto &[tp, offset] : record) {
                m[tp] = offset;
        }
}

Sluice::commit_record TestBroker::committed(const std::string &group_id, const std::vector<topic_partition> &partitions, const uint64_t) {
        std::unique_lock<std::mutex> g(lock);
        Sluice::commit_record        res;

        ++calls.committed;
        if (const auto it = commits.find(group_id); it != commits.end()) {
                for (const auto &tp : partitions) {
                        if (const auto pit = it->second.find(tp); pit != it->second.end()) {
                                res.emplace_back(tp, pit->second);
                        }
                }
        }

        return res;
}

std::vector<std::pair<topic_partition, tl::optional<Sluice::offset_and_timestamp>>> TestBroker::list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &targets,
                                                                                                            const uint64_t                                       timeout_ms) {
        std::unique_lock<std::mutex>                                                        g(lock);
        std::vector<std::pair<topic_partition, tl::optional<Sluice::offset_and_timestamp>>> res;

        ++calls.list_offsets;
        for (const auto &[tp, target] : targets) {
                const auto it = logs.find(tp);

                if (it == logs.end()) {
                        // a real broker never answers for a partition it doesn't know about
                        throw Sluice::timeout_error("ListOffsets for ", tp, " timed out after ", timeout_ms, "ms");
                }

                const auto &log = it->second;

                if (target == Sluice::ListOffsetsTarget::Earliest) {
                        res.emplace_back(tp, Sluice::offset_and_timestamp{log.first_available, -1});
                } else if (target == Sluice::ListOffsetsTarget::Latest) {
                        res.emplace_back(tp, Sluice::offset_and_timestamp{log.next_offset, -1});
                } else {
                        const auto bit = std::find_if(log.bundles.begin(), log.bundles.end(), [target = target](const auto &b) { return b.first_ts >= target; });

                        if (bit == log.bundles.end()) {
                                res.emplace_back(tp, tl::nullopt);
                        } else {
                                res.emplace_back(tp, Sluice::offset_and_timestamp{bit->first_offset, bit->first_ts});
                        }
                }
        }

        return res;
}
