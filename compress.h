#pragma once
#include "common.h"

namespace Compression {
        // codec identifiers, as encoded in the two low bits of a bundle's flags
        enum class Algo : int8_t {
                UNKNOWN = -1,
                NONE    = 0,
                SNAPPY  = 1,
                GZIP    = 2,
                LZ4     = 3,
        };

        const char *algo_name(const Algo a) noexcept;

        // parses "none", "snappy", "gzip", "lz4"; returns Algo::UNKNOWN otherwise
        Algo algo_by_name(const std::string_view name) noexcept;

        inline Algo algo_from_bundle_flags(const uint8_t flags) noexcept {
                return static_cast<Algo>(flags & 3);
        }

        bool Compress(const Algo algorithm, const void *data, const size_t dataLen, std::string *dest);

        bool UnCompress(const Algo algorithm, const void *source, const size_t sourceLen, std::string *dest);

        // A closed registry of the codecs we know about, and whether each of them can be used.
        // Every codec is linked in; a codec is unavailable only when it has been explicitly disabled (see consumer_conf::disabled_codecs),
        // which is how a deployment without a codec's library is modelled.
        //
        // The registry is owned by a consumer (no process-wide state) and availability is decided at configuration time
        // so that a missing codec is detected before any I/O.
        class CodecRegistry final {
              public:
                struct codec final {
                        Algo        algo;
                        const char *name;
                        bool (*decode)(const uint8_t *, const size_t, std::string *);
                        bool available;
                };

              private:
                codec codecs[4];

              public:
                CodecRegistry();

                void set_available(const Algo a, const bool v);

                bool is_available(const Algo a) const noexcept;

                // throws Sluice::unsupported_codec if `a` is not known or not available
                void ensure_available(const Algo a) const;

                // throws Sluice::unsupported_codec, or Sluice::corrupt_message if decompression fails
                void decode(const Algo a, const uint8_t *content, const size_t len, std::string *out) const;
        };

        inline uint8_t *encode_varuint32(const uint32_t n, uint8_t *out) noexcept {
                if (n < (1u << 7)) {
                        *(out++) = n;
                } else if (n < (1u << 14)) {
                        *(out++) = n | 128;
                        *(out++) = n >> 7;
                } else if (n < (1u << 21)) {
                        *(out++) = n | 128;
                        *(out++) = (n >> 7) | 128;
                        *(out++) = n >> 14;
                } else if (n < (1u << 28)) {
                        *(out++) = n | 128;
                        *(out++) = (n >> 7) | 128;
                        *(out++) = (n >> 14) | 128;
                        *(out++) = n >> 21;
                } else {
                        *(out++) = n | 128;
                        *(out++) = (n >> 7) | 128;
                        *(out++) = (n >> 14) | 128;
                        *(out++) = (n >> 21) | 128;
                        *(out++) = n >> 28;
                }

                return out;
        }

        // true iff a complete varuint32 can be decoded from [p, e)
        inline bool check_decode_varuint32(const uint8_t *p, const uint8_t *const e) noexcept {
                for (uint8_t i{0}; i != 5; ++i, ++p) {
                        if (unlikely(p >= e)) {
                                return false;
                        } else if (*p < 128) {
                                return true;
                        }
                }

                return false;
        }

        inline uint32_t decode_varuint32(const uint8_t *&buf) noexcept {
                uint32_t r{0};

                for (uint8_t shift{0};; shift += 7) {
                        const auto v = *(buf++);

                        r |= uint32_t(v & 127) << shift;
                        if (v < 128) {
                                return r;
                        }
                }
        }

        inline void PrintImpl(std::string &out, const Algo a) {
                out.append(algo_name(a));
        }
} // namespace Compression
