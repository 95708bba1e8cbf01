#include <catch2/catch.hpp>
#include "fetch_buffers.h"
#include "sluice_exceptions.h"
#include "test_broker.h"

using namespace Sluice;

namespace {
        struct fetch_env final {
                consumer_conf              conf;
                Compression::CodecRegistry codecs;
                cancellation_token         cancel;
                PartitionCursors           cursors;
                MessageDecoder             decoder;
                OffsetsResolver            resolver;
                FetchBufferManager         fetcher;

                fetch_env(BrokerTransport *const t, const consumer_conf &c)
                    : conf{c}
                    , cursors{c.auto_offset_reset, c.max_partition_fetch_bytes}
                    , decoder{codecs}
                    , resolver{t, c.request_timeout_ms}
                    , fetcher{t, cursors, decoder, resolver, conf, cancel} {
                        conf.validate();
                }

                void assign(const topic_partition &tp, const tl::optional<uint64_t> committed) {
                        cursors.on_assign(tp, committed, [this](const topic_partition &p, const offset_reset_policy policy) {
                                return resolver.boundary(p, policy);
                        });
                }

                tl::optional<decoded_batch> fetch(const topic_partition &tp) {
                        for (const auto &e : cursors.plan(0)) {
                                if (e.tp == tp) {
                                        return fetcher.fetch(e);
                                }
                        }

                        return tl::nullopt;
                }

                // what the poller does for every returned message
                void consume(const decoded_batch &b) {
                        for (const auto &m : b.msgs) {
                                REQUIRE(cursors.advance(b.tp, b.generation, m.offset));
                        }
                }
        };

        // a broker for which every offset is out of range
        struct out_of_range_transport final
            : public BrokerTransport {
                size_t fetches{0};

                fetch_response fetch(const topic_partition &, const uint64_t, const uint32_t, const uint64_t) override {
                        fetch_response r;

                        ++fetches;
                        r.status          = fetch_response::Status::OutOfRange;
                        r.first_available = 5;
                        r.high_water_mark = 10;
                        return r;
                }

                void commit(const std::string &, const commit_record &, const uint64_t) override {
                }

                commit_record committed(const std::string &, const std::vector<topic_partition> &, const uint64_t) override {
                        return {};
                }

                std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> list_offsets(const std::vector<std::pair<topic_partition, int64_t>> &targets, const uint64_t) override {
                        std::vector<std::pair<topic_partition, tl::optional<offset_and_timestamp>>> res;

                        for (const auto &[tp, target] : targets) {
                                res.emplace_back(tp, offset_and_timestamp{target == ListOffsetsTarget::Earliest ? 5u : 10u, -1});
                        }

                        return res;
                }

                bool supports_timestamp_lookup() const noexcept override {
                        return true;
                }
        };
} // namespace

TEST_CASE("fetch:growth") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);
        const std::string     big(1048, 'x');

        conf.max_partition_fetch_bytes = 1024;
        conf.max_buffer_size           = 4096;
        broker.produce(tp, {big});

        SECTION("truncated response") {
                broker.oversize_mode = TestBroker::OversizeMode::Truncate;
        }

        SECTION("size too small") {
                broker.oversize_mode = TestBroker::OversizeMode::SizeTooSmall;
        }

        SECTION("size too small, size unknown") {
                broker.oversize_mode = TestBroker::OversizeMode::SizeTooSmallUnknown;
        }

        fetch_env env(&broker, conf);

        env.assign(tp, 0);

        const auto batch = env.fetch(tp);

        REQUIRE(batch);
        REQUIRE(batch->msgs.size() == 1);
        REQUIRE(batch->msgs[0].value == big);
        REQUIRE(broker.calls.fetch == 2);
        REQUIRE(env.cursors.get(tp).fetch_buffer_size == 2048);
        // the fetch manager never moves the position
        REQUIRE(env.cursors.get(tp).fetch_offset == 0);
}

TEST_CASE("fetch:growth past the cap") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);

        conf.max_partition_fetch_bytes = 1024;
        conf.max_buffer_size           = 1024;
        broker.produce(tp, {std::string(1048, 'x')});

        SECTION("truncated response") {
                broker.oversize_mode = TestBroker::OversizeMode::Truncate;
        }

        SECTION("size too small") {
                broker.oversize_mode = TestBroker::OversizeMode::SizeTooSmall;
        }

        fetch_env env(&broker, conf);

        env.assign(tp, 0);

        try {
                env.fetch(tp);
                FAIL("fetch_size_too_small expected");
        } catch (const fetch_size_too_small &e) {
                REQUIRE(e.tp == tp);
                REQUIRE(e.required_size > 1048);
        }

        REQUIRE(env.cursors.get(tp).fetch_offset == 0);
        REQUIRE(env.cursors.get(tp).fetch_buffer_size == 1024);
        REQUIRE_FALSE(env.cursors.get(tp).failed);
}

TEST_CASE("fetch:unbounded growth") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);

        conf.max_partition_fetch_bytes = 1024;
        conf.max_buffer_size           = 0;
        broker.produce(tp, {std::string(5000, 'x')});

        fetch_env env(&broker, conf);

        env.assign(tp, 0);
        REQUIRE(env.fetch(tp)->msgs.size() == 1);
        REQUIRE(env.cursors.get(tp).fetch_buffer_size == 8192);
}

TEST_CASE("fetch:shrink") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);

        conf.max_partition_fetch_bytes = 1024;
        conf.max_buffer_size           = 4096;
        conf.buffer_shrink_after       = 2;
        broker.produce(tp, {std::string(1048, 'x')});

        fetch_env env(&broker, conf);

        env.assign(tp, 0);
        env.consume(*env.fetch(tp));
        REQUIRE(env.cursors.get(tp).fetch_buffer_size == 2048);

        broker.produce(tp, {"a"});
        env.consume(*env.fetch(tp));
        REQUIRE(env.cursors.get(tp).fetch_buffer_size == 2048);
        REQUIRE(env.cursors.get(tp).fits_default_run == 1);

        broker.produce(tp, {"b"});
        env.consume(*env.fetch(tp));
        REQUIRE(env.cursors.get(tp).fetch_buffer_size == 1024);
        REQUIRE(env.cursors.get(tp).fetch_offset == 3);
}

TEST_CASE("fetch:empty") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);

        broker.produce_each(tp, {"a", "b", "c"});

        fetch_env env(&broker, conf);

        env.assign(tp, 3);
        REQUIRE_FALSE(env.fetch(tp));
        REQUIRE(env.cursors.get(tp).high_water_mark == 3);
        REQUIRE(env.cursors.get(tp).fetch_offset == 3);

        SECTION("cancelled") {
                const auto before = broker.calls.fetch;

                broker.produce(tp, {"d"});
                env.cancel.wakeup = true;
                REQUIRE_FALSE(env.fetch(tp));
                REQUIRE(broker.calls.fetch == before);

                env.cancel.wakeup = false;
                REQUIRE(env.fetch(tp)->msgs.size() == 1);
        }
}

TEST_CASE("fetch:out of range") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);

        broker.produce_each(tp, {"0", "1", "2", "3", "4", "5", "6", "7", "8", "9"});
        broker.truncate_head(tp, 5);

        SECTION("reset to earliest") {
                conf.auto_offset_reset = offset_reset_policy::Earliest;

                fetch_env env(&broker, conf);

                env.assign(tp, 2);

                const auto batch = env.fetch(tp);

                REQUIRE(batch);
                REQUIRE(batch->msgs.front().offset == 5);
                REQUIRE(batch->msgs.size() == 5);
                REQUIRE(env.cursors.get(tp).fetch_offset == 5);
        }

        SECTION("reset to latest") {
                conf.auto_offset_reset = offset_reset_policy::Latest;

                fetch_env env(&broker, conf);

                env.assign(tp, 2);
                REQUIRE_FALSE(env.fetch(tp));
                REQUIRE(env.cursors.get(tp).fetch_offset == 10);
        }

        SECTION("no reset") {
                conf.auto_offset_reset            = offset_reset_policy::Earliest;
                conf.reset_offset_on_out_of_range = false;

                fetch_env env(&broker, conf);

                env.assign(tp, 2);

                try {
                        env.fetch(tp);
                        FAIL("offset_out_of_range expected");
                } catch (const offset_out_of_range &e) {
                        REQUIRE(e.tp == tp);
                        REQUIRE(e.requested == 2);
                        REQUIRE(e.first_available == 5);
                        REQUIRE(e.high_water_mark == 10);
                }

                REQUIRE(env.cursors.get(tp).fetch_offset == 2);
        }

        SECTION("fail policy") {
                conf.auto_offset_reset = offset_reset_policy::Fail;

                fetch_env env(&broker, conf);

                env.assign(tp, 12);
                REQUIRE_THROWS_AS(env.fetch(tp), offset_out_of_range);
        }
}

TEST_CASE("fetch:repeated out of range") {
        out_of_range_transport transport;
        consumer_conf          conf;
        const topic_partition  tp("orders", 0);

        conf.auto_offset_reset = offset_reset_policy::Earliest;

        fetch_env env(&transport, conf);

        env.assign(tp, 0);
        REQUIRE_THROWS_AS(env.fetch(tp), offset_out_of_range);
        REQUIRE(transport.fetches == 2);
        REQUIRE(env.cursors.get(tp).failed);
        REQUIRE(env.cursors.plan(0).empty());

        env.cursors.seek(tp, 7);
        REQUIRE(env.cursors.plan(0).size() == 1);
}

TEST_CASE("fetch:faults") {
        TestBroker            broker;
        consumer_conf         conf;
        const topic_partition tp("orders", 0);

        SECTION("unknown partition") {
                fetch_env env(&broker, conf);

                env.assign(tp, 0);
                REQUIRE_THROWS_AS(env.fetch(tp), timeout_error);
                REQUIRE(env.cursors.get(tp).fetch_offset == 0);
        }

        SECTION("unsupported codec") {
                broker.produce(tp, {"a", "b"}, Compression::Algo::SNAPPY);

                fetch_env env(&broker, conf);

                env.codecs.set_available(Compression::Algo::SNAPPY, false);
                env.assign(tp, 0);
                REQUIRE_THROWS_AS(env.fetch(tp), unsupported_codec);
                REQUIRE(env.cursors.get(tp).fetch_offset == 0);
                // not retried
                REQUIRE(broker.calls.fetch == 1);
        }

        SECTION("corrupt bundle") {
                broker.produce_raw(tp, std::string("\x0e\x02\x00\x00\x00\x00\x00\x00\x00\x00\x01garb", 15), 1);

                fetch_env env(&broker, conf);

                env.assign(tp, 0);
                REQUIRE_THROWS_AS(env.fetch(tp), corrupt_message);
                REQUIRE(env.cursors.get(tp).fetch_offset == 0);
        }
}
