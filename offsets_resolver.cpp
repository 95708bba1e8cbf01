#include "offsets_resolver.h"
#include "sluice_exceptions.h"

using namespace Sluice;

std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> OffsetsResolver::list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &targets) {
        static constexpr bool trace{false};
        const auto            before = Timings::Milliseconds::Tick();
        auto                  res    = transport->list_offsets(targets, request_timeout_ms);

        if (trace) {
                SLog("list_offsets() for ", targets.size(), " partitions took ", Timings::Milliseconds::Since(before), "ms\n");
        }

        if (res.size() < targets.size()) {
                // a partition the broker doesn't know about is never answered for
                robin_hood::unordered_set<topic_partition> answered;

                for (const auto &it : res) {
                        answered.insert(it.first);
                }

                for (const auto &it : targets) {
                        if (!answered.count(it.first)) {
                                throw timeout_error("Failed to get offsets for ", it.first, " after ", request_timeout_ms, "ms");
                        }
                }
        }

        return res;
}

OffsetsResolver::resolved_offsets OffsetsResolver::resolve(const std::vector<std::pair<topic_partition, int64_t>> &targets) {
        resolved_offsets res;

        for (const auto &[tp, ts] : targets) {
                if (ts < 0) {
                        throw invalid_argument("Negative timestamp ", ts, " for ", tp);
                }
        }

        if (targets.empty()) {
                return res;
        } else if (!transport->supports_timestamp_lookup()) {
                throw unsupported_version("Offsets lookup by timestamp is not supported by the broker");
        }

        for (auto &it : list_offsets(targets)) {
                res.emplace(std::move(it.first), it.second);
        }

        return res;
}

robin_hood::unordered_map<topic_partition, uint64_t> OffsetsResolver::boundaries(const std::vector<topic_partition> &partitions, const int64_t target) {
        std::vector<std::pair<topic_partition, int64_t>>     targets;
        robin_hood::unordered_map<topic_partition, uint64_t> res;

        if (partitions.empty()) {
                return res;
        }

        targets.reserve(partitions.size());
        for (const auto &tp : partitions) {
                targets.emplace_back(tp, target);
        }

        for (const auto &[tp, v] : list_offsets(targets)) {
                if (!v) {
                        // boundaries are always defined, even for an empty partition
                        throw timeout_error("Broker did not report the ", target == ListOffsetsTarget::Earliest ? "earliest" : "latest", " offset of ", tp);
                }

                res.emplace(tp, v->offset);
        }

        return res;
}

robin_hood::unordered_map<topic_partition, uint64_t> OffsetsResolver::beginning_offsets(const std::vector<topic_partition> &partitions) {
        return boundaries(partitions, ListOffsetsTarget::Earliest);
}

robin_hood::unordered_map<topic_partition, uint64_t> OffsetsResolver::end_offsets(const std::vector<topic_partition> &partitions) {
        return boundaries(partitions, ListOffsetsTarget::Latest);
}

uint64_t OffsetsResolver::boundary(const topic_partition &tp, const offset_reset_policy policy) {
        SLUICE_EXPECT(policy != offset_reset_policy::Fail);

        const auto res = boundaries({tp}, policy == offset_reset_policy::Earliest ? ListOffsetsTarget::Earliest : ListOffsetsTarget::Latest);

        return res.find(tp)->second;
}
