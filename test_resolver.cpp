#include <catch2/catch.hpp>
#include "offsets_resolver.h"
#include "sluice_exceptions.h"
#include "test_broker.h"

using namespace Sluice;

namespace {
        // answers every list-offsets request, but without an offset
        struct unanswered_transport final
            : public BrokerTransport {
                fetch_response fetch(const topic_partition &, const uint64_t, const uint32_t, const uint64_t) override {
                        return {};
                }

                void commit(const std::string &, const commit_record &, const uint64_t) override {
                }

                commit_record committed(const std::string &, const std::vector<topic_partition> &, const uint64_t) override {
                        return {};
                }

                std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &targets, const uint64_t) override {
                        std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> res;

                        for (const auto &it : targets) {
                                res.emplace_back(it.first, tl::nullopt);
                        }

                        return res;
                }

                bool supports_timestamp_lookup() const noexcept override {
                        return true;
                }
        };
} // namespace

TEST_CASE("resolver:timestamps") {
        TestBroker            broker;
        OffsetsResolver       resolver(&broker, 1000);
        const topic_partition tp("events", 0);

        broker.produce(tp, {"a", "b", "c"}, Compression::Algo::NONE, 1000);
        broker.produce(tp, {"d", "e"}, Compression::Algo::NONE, 2000);
        broker.produce(tp, {"f"}, Compression::Algo::NONE, 3000);

        SECTION("lookups") {
                const auto lookup = [&](const int64_t ts) {
                        const auto res = resolver.resolve({{tp, ts}});

                        REQUIRE(res.size() == 1);
                        return res.find(tp)->second;
                };

                REQUIRE(lookup(0).value() == offset_and_timestamp{0, 1000});
                REQUIRE(lookup(1000).value() == offset_and_timestamp{0, 1000});
                REQUIRE(lookup(1500).value() == offset_and_timestamp{3, 2000});
                REQUIRE(lookup(3000).value() == offset_and_timestamp{5, 3000});
                // past the newest message
                REQUIRE_FALSE(lookup(3001));
                REQUIRE(broker.calls.list_offsets == 5);
        }

        SECTION("no partitions") {
                REQUIRE(resolver.resolve({}).empty());
                REQUIRE(broker.calls.list_offsets == 0);
        }

        SECTION("negative timestamp") {
                broker.create({"events", 1});
                REQUIRE_THROWS_AS(resolver.resolve({{{"events", 1}, 10}, {tp, -5}}), invalid_argument);
                REQUIRE(broker.calls.list_offsets == 0);
        }

        SECTION("lookup by timestamp not supported") {
                broker.timestamp_lookup = false;
                REQUIRE_THROWS_AS(resolver.resolve({{tp, 1000}}), unsupported_version);
                REQUIRE(broker.calls.list_offsets == 0);

                // boundaries don't need it
                REQUIRE(resolver.boundary(tp, offset_reset_policy::Latest) == 6);
        }

        SECTION("unknown partition") {
                REQUIRE_THROWS_AS(resolver.resolve({{tp, 1000}, {{"events", 9}, 1000}}), timeout_error);
        }
}

TEST_CASE("resolver:boundaries") {
        TestBroker            broker;
        OffsetsResolver       resolver(&broker, 1000);
        const topic_partition p0("events", 0), p1("events", 1);

        broker.produce_each(p0, {"a", "b", "c", "d"});
        broker.create(p1);

        SECTION("retained range") {
                auto begin = resolver.beginning_offsets({p0, p1});
                auto end   = resolver.end_offsets({p0, p1});

                REQUIRE(begin.size() == 2);
                REQUIRE(begin[p0] == 0);
                REQUIRE(begin[p1] == 0);
                REQUIRE(end[p0] == 4);
                REQUIRE(end[p1] == 0);

                broker.truncate_head(p0, 2);
                begin = resolver.beginning_offsets({p0});
                REQUIRE(begin[p0] == 2);
                REQUIRE(resolver.boundary(p0, offset_reset_policy::Earliest) == 2);
                REQUIRE(resolver.boundary(p0, offset_reset_policy::Latest) == 4);
        }

        SECTION("empty") {
                REQUIRE(resolver.end_offsets({}).empty());
                REQUIRE(broker.calls.list_offsets == 0);
        }

        SECTION("unknown partition") {
                REQUIRE_THROWS_AS(resolver.beginning_offsets({p0, {"events", 7}}), timeout_error);
        }
}

TEST_CASE("resolver:missing boundary") {
        unanswered_transport  transport;
        OffsetsResolver       resolver(&transport, 1000);
        const topic_partition tp("events", 0);

        REQUIRE_THROWS_AS(resolver.beginning_offsets({tp}), timeout_error);
        REQUIRE_THROWS_AS(resolver.end_offsets({tp}), timeout_error);
        REQUIRE_THROWS_AS(resolver.boundary(tp, offset_reset_policy::Latest), timeout_error);

        // a timestamp with no offset at or after it is not a fault
        const auto res = resolver.resolve({{tp, 1000}});

        REQUIRE(res.size() == 1);
        REQUIRE_FALSE(res.find(tp)->second);
}
