#pragma once
#include "common.h"
#include <exception>

namespace Sluice {
        struct exception
            : public std::exception {
                std::string b;

                template <typename... T>
                [[gnu::noinline]] explicit exception(const T &... args) {
                        ToBuffer(b, args...);
                }

                exception(const exception &o) = default;

                exception(exception &&o) = default;

                exception() = delete;

                const char *what() const noexcept override {
                        return b.c_str();
                }
        };

        // FetchSizeTooSmallError
        // the next message of `tp` requires at least `required_size` bytes, which is past the configured cap
        struct fetch_size_too_small final
            : public exception {
                topic_partition tp;
                uint64_t        required_size;

                fetch_size_too_small(const topic_partition &_tp, const uint64_t required, const uint64_t cap)
                    : exception("Message at ", _tp, " requires a fetch buffer of ", required,
                                " bytes, larger than max_buffer_size(", cap, ")")
                    , tp{_tp}
                    , required_size{required} {
                }
        };

        // OffsetOutOfRangeError
        struct offset_out_of_range final
            : public exception {
                topic_partition tp;
                uint64_t        requested;
                uint64_t        first_available;
                uint64_t        high_water_mark;

                offset_out_of_range(const topic_partition &_tp, const uint64_t r, const uint64_t first, const uint64_t hwm)
                    : exception("Offset ", r, " out of range for ", _tp, " [", first, ", ", hwm, ")")
                    , tp{_tp}
                    , requested{r}
                    , first_available{first}
                    , high_water_mark{hwm} {
                }
        };

        // OffsetResetRequiredError
        struct offset_reset_required final
            : public exception {
                topic_partition tp;

                explicit offset_reset_required(const topic_partition &_tp)
                    : exception("No committed offset for ", _tp, " and auto_offset_reset is 'fail'")
                    , tp{_tp} {
                }
        };

        // UnsupportedCodecError
        struct unsupported_codec final
            : public exception {
                template <typename... T>
                explicit unsupported_codec(const T &... args)
                    : exception(args...) {
                }
        };

        // UnsupportedVersionError
        struct unsupported_version final
            : public exception {
                template <typename... T>
                explicit unsupported_version(const T &... args)
                    : exception(args...) {
                }
        };

        // InvalidArgumentError
        struct invalid_argument final
            : public exception {
                template <typename... T>
                explicit invalid_argument(const T &... args)
                    : exception(args...) {
                }
        };

        // KafkaTimeoutError class; raised by the transport, propagated as is
        struct timeout_error final
            : public exception {
                template <typename... T>
                explicit timeout_error(const T &... args)
                    : exception(args...) {
                }
        };

        // CorruptMessageError
        struct corrupt_message final
            : public exception {
                template <typename... T>
                explicit corrupt_message(const T &... args)
                    : exception(args...) {
                }
        };

        struct partition_not_owned final
            : public exception {
                topic_partition tp;

                explicit partition_not_owned(const topic_partition &_tp)
                    : exception("Partition ", _tp, " is not assigned to this consumer")
                    , tp{_tp} {
                }
        };

        struct commit_failed final
            : public exception {
                template <typename... T>
                explicit commit_failed(const T &... args)
                    : exception(args...) {
                }
        };

        struct consumer_closed final
            : public exception {
                consumer_closed()
                    : exception("Consumer is closed") {
                }
        };

        struct config_error final
            : public exception {
                template <typename... T>
                explicit config_error(const T &... args)
                    : exception(args...) {
                }
        };
} // namespace Sluice
