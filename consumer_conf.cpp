#include "consumer_conf.h"
#include "compress.h"
#include "sluice_exceptions.h"
#include <nlohmann/json.hpp>

void consumer_conf::validate() const {
        if (max_partition_fetch_bytes == 0) {
                throw Sluice::config_error("max_partition_fetch_bytes must be > 0");
        } else if (max_buffer_size && max_buffer_size < max_partition_fetch_bytes) {
                throw Sluice::config_error("max_buffer_size(", max_buffer_size, ") must be >= max_partition_fetch_bytes(", max_partition_fetch_bytes, ")");
        } else if (fetch_max_bytes == 0) {
                throw Sluice::config_error("fetch_max_bytes must be > 0");
        } else if (consumer_timeout_ms == 0 || request_timeout_ms == 0) {
                // blocking calls are always bounded
                throw Sluice::config_error("consumer_timeout_ms and request_timeout_ms must be > 0");
        } else if (max_poll_records == 0) {
                throw Sluice::config_error("max_poll_records must be > 0");
        } else if (poll_granularity_ms == 0) {
                throw Sluice::config_error("poll_granularity_ms must be > 0");
        } else if (group_id.size() > Sluice_Limits::max_topic_name_len) {
                throw Sluice::config_error("group_id is too long");
        }

        for (const auto &it : disabled_codecs) {
                if (const auto a = Compression::algo_by_name(it); a == Compression::Algo::UNKNOWN || a == Compression::Algo::NONE) {
                        throw Sluice::config_error("Unexpected codec '", it, "' in disabled_codecs");
                }
        }
}

consumer_conf consumer_conf::from_json(const std::string_view content) {
        static constexpr bool trace{false};
        using json = nlohmann::json;
        consumer_conf conf;
        json          doc;

        try {
                doc = json::parse(content);
        } catch (const std::exception &e) {
                throw Sluice::config_error("Failed to parse configuration: ", e.what());
        }

        if (!doc.is_object()) {
                throw Sluice::config_error("Configuration is not a JSON object");
        }

        const auto as_u64 = [](const std::string &key, const json &value) -> uint64_t {
                if (!value.is_number_unsigned()) {
                        if (value.is_number_integer() && value.get<int64_t>() >= 0) {
                                return value.get<int64_t>();
                        }

                        throw Sluice::config_error("Expected a non-negative integer for '", key, "'");
                }

                return value.get<uint64_t>();
        };

        try {
                for (auto it = doc.begin(); it != doc.end(); ++it) {
                        const auto &key   = it.key();
                        const auto &value = it.value();

                        if (key == "group_id") {
                                conf.group_id = value.get<std::string>();
                        } else if (key == "auto_offset_reset") {
                                const auto v = value.get<std::string>();

                                // smallest/largest are accepted for older configurations
                                if (v == "earliest" || v == "smallest") {
                                        conf.auto_offset_reset = offset_reset_policy::Earliest;
                                } else if (v == "latest" || v == "largest") {
                                        conf.auto_offset_reset = offset_reset_policy::Latest;
                                } else if (v == "fail" || v == "none") {
                                        conf.auto_offset_reset = offset_reset_policy::Fail;
                                } else {
                                        throw Sluice::config_error("Unexpected auto_offset_reset '", v, "'");
                                }
                        } else if (key == "reset_offset_on_out_of_range") {
                                conf.reset_offset_on_out_of_range = value.get<bool>();
                        } else if (key == "enable_auto_commit") {
                                conf.enable_auto_commit = value.get<bool>();
                        } else if (key == "auto_commit_interval_ms") {
                                conf.auto_commit_interval_ms = as_u64(key, value);
                        } else if (key == "auto_commit_every_n") {
                                conf.auto_commit_every_n = as_u64(key, value);
                        } else if (key == "fetch_max_bytes") {
                                conf.fetch_max_bytes = as_u64(key, value);
                        } else if (key == "max_partition_fetch_bytes") {
                                const auto v = as_u64(key, value);

                                if (v > std::numeric_limits<uint32_t>::max()) {
                                        throw Sluice::config_error("max_partition_fetch_bytes is too large");
                                }

                                conf.max_partition_fetch_bytes = v;
                        } else if (key == "max_buffer_size") {
                                // null disables the cap
                                conf.max_buffer_size = value.is_null() ? 0 : as_u64(key, value);
                        } else if (key == "buffer_shrink_after") {
                                conf.buffer_shrink_after = std::min<uint64_t>(as_u64(key, value), std::numeric_limits<uint32_t>::max());
                        } else if (key == "consumer_timeout_ms") {
                                conf.consumer_timeout_ms = as_u64(key, value);
                        } else if (key == "request_timeout_ms") {
                                conf.request_timeout_ms = as_u64(key, value);
                        } else if (key == "max_poll_records") {
                                conf.max_poll_records = std::min<uint64_t>(as_u64(key, value), std::numeric_limits<uint32_t>::max());
                        } else if (key == "poll_granularity_ms") {
                                conf.poll_granularity_ms = std::min<uint64_t>(as_u64(key, value), std::numeric_limits<uint32_t>::max());
                        } else if (key == "disabled_codecs") {
                                conf.disabled_codecs = value.get<std::vector<std::string>>();
                        } else if (trace) {
                                SLog("Unexpected key '", key, "'\n");
                        }
                }
        } catch (const json::exception &e) {
                throw Sluice::config_error("Unexpected configuration value: ", e.what());
        }

        conf.validate();
        return conf;
}
