#pragma once
#include "broker_transport.h"
#include "compress.h"
#include <string_view>

namespace Sluice {
        // messages decoded from one fetch response of one partition
        struct decoded_batch final {
                topic_partition           tp;
                // generation of the cursor when the fetch was planned
                uint64_t                  generation;
                std::vector<consumed_msg> msgs;
                uint64_t                  high_water_mark;
                // size of the chunk the messages were decoded from
                size_t chunk_size;
        };

        // Decodes bundles:
        // bundle := varuint32 bundle_len, u8 flags (codec in bits 0..1), u64 base_offset, varuint32 msgs_cnt, msgset
        // msg    := u8 flags, [varuint32 offset_delta], [u64 ts], [u8 key_len, key], varuint32 value_len, value
        class MessageDecoder final {
              public:
                struct chunk_result final {
                        std::vector<consumed_msg> msgs;
                        // if != 0, no message could be decoded because the first bundle of interest
                        // was truncated; a fetch of at least need_bytes will capture it
                        uint64_t need_bytes{0};
                        // the walk stopped at a bundle that could not be decoded, after some messages were captured
                        bool stopped_early{false};
                        // largest complete bundle (including its length prefix) seen
                        uint64_t max_bundle_size{0};
                };

              private:
                const Compression::CodecRegistry &codecs;
                // reused across decode() calls
                std::string decompressed;

              public:
                explicit MessageDecoder(const Compression::CodecRegistry &r)
                    : codecs{r} {
                }

                // decodes the (possibly compressed) message set of a single bundle
                // throws unsupported_codec or corrupt_message; nothing is returned on failure
                std::vector<consumed_msg> decode(const std::string_view msgset, const Compression::Algo codec,
                                                 const uint64_t base_offset, const uint32_t msgs_cnt);

                // walks the bundles of a fetch response chunk; messages with offset < min_offset or
                // offset >= high_water_mark are dropped
                chunk_result decode_chunk(const std::string_view chunk, const uint64_t min_offset, const uint64_t high_water_mark);
        };

        // appends an encoded bundle of `msgs` (ordered by offset, first offset >= base_offset) to `out`
        // gaps between offsets are encoded as offset deltas
        // throws invalid_argument for keys longer than 255 bytes
        void encode_bundle(std::string *out, const Compression::Algo codec, const uint64_t base_offset,
                           const std::vector<consumed_msg> &msgs);
} // namespace Sluice
