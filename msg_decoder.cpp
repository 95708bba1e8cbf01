#include "msg_decoder.h"
#include "sluice_exceptions.h"

using namespace Sluice;

std::vector<consumed_msg> MessageDecoder::decode(const std::string_view msgset, const Compression::Algo codec,
                                                 const uint64_t base_offset, const uint32_t msgs_cnt) {
        static constexpr bool     trace{false};
        std::vector<consumed_msg> res;
        const uint8_t *           p;
        const uint8_t *           msgset_end;
        uint64_t                  next_offset = base_offset;
        int64_t                   ts{0};
        bool                      have_ts{false};

        // before any decompression is attempted
        codecs.ensure_available(codec);

        if (codec != Compression::Algo::NONE) {
                decompressed.clear();
                codecs.decode(codec, reinterpret_cast<const uint8_t *>(msgset.data()), msgset.size(), &decompressed);

                if (trace) {
                        SLog("Decompressed ", size_repr(msgset.size()), " => ", size_repr(decompressed.size()), " (", codec, ")\n");
                }

                p          = reinterpret_cast<const uint8_t *>(decompressed.data());
                msgset_end = p + decompressed.size();
        } else {
                p          = reinterpret_cast<const uint8_t *>(msgset.data());
                msgset_end = p + msgset.size();
        }

        // msgs_cnt comes off the wire
        res.reserve(std::min<size_t>(msgs_cnt, std::distance(p, msgset_end)));

        for (uint32_t i{0}; i < msgs_cnt; ++i) {
                if (unlikely(p >= msgset_end)) {
                        throw corrupt_message("Message set holds ", i, " messages, expected ", msgs_cnt);
                }

                const auto msg_flags = decode_pod<uint8_t>(p);
                consumed_msg m;

                if (msg_flags & unsigned(SluiceFlags::BundleMsgFlags::HaveOffsetDelta)) {
                        if (unlikely(!Compression::check_decode_varuint32(p, msgset_end))) {
                                throw corrupt_message("Unable to decode offset delta of message ", i);
                        }

                        next_offset += Compression::decode_varuint32(p);
                }

                m.offset = next_offset++;

                if (0 == (msg_flags & unsigned(SluiceFlags::BundleMsgFlags::UseLastSpecifiedTS))) {
                        if (unlikely(p + sizeof(uint64_t) > msgset_end)) {
                                throw corrupt_message("Unable to decode timestamp of message ", i);
                        }

                        ts      = decode_pod<int64_t>(p);
                        have_ts = true;
                } else if (unlikely(!have_ts)) {
                        throw corrupt_message("Message ", i, " refers to a timestamp that was never specified");
                }

                m.ts = ts;

                if (msg_flags & unsigned(SluiceFlags::BundleMsgFlags::HaveKey)) {
                        if (unlikely(p + sizeof(uint8_t) > msgset_end || (p + *p + sizeof(uint8_t) > msgset_end))) {
                                throw corrupt_message("Key of message ", i, " overruns the message set");
                        }

                        m.key.assign(reinterpret_cast<const char *>(p) + 1, *p);
                        p += sizeof(uint8_t) + m.key.size();
                }

                if (unlikely(!Compression::check_decode_varuint32(p, msgset_end))) {
                        throw corrupt_message("Unable to decode length of message ", i);
                }

                const auto len = Compression::decode_varuint32(p);

                if (unlikely(len > std::distance(p, msgset_end))) {
                        throw corrupt_message("Message ", i, " (", len, " bytes) overruns the message set");
                }

                m.value.assign(reinterpret_cast<const char *>(p), len);
                p += len;

                res.emplace_back(std::move(m));
        }

        if (unlikely(p != msgset_end)) {
                throw corrupt_message("Unexpected ", std::distance(p, msgset_end), " trailing bytes in message set");
        }

        return res;
}

MessageDecoder::chunk_result MessageDecoder::decode_chunk(const std::string_view chunk, const uint64_t min_offset, const uint64_t high_water_mark) {
        static constexpr bool trace{false};
        static constexpr auto bundle_hdr_min_size = sizeof(uint8_t) + sizeof(uint64_t) + sizeof(uint8_t);
        const auto *const     chunk_start         = reinterpret_cast<const uint8_t *>(chunk.data());
        const auto *const     chunk_end           = chunk_start + chunk.size();
        chunk_result          res;

        for (const auto *p = chunk_start; p < chunk_end;) {
                if (unlikely(!Compression::check_decode_varuint32(p, chunk_end))) {
                        if (trace) {
                                SLog("Unable to decode bundle_len at ", std::distance(chunk_start, p), "\n");
                        }

                        if (res.msgs.empty()) {
                                res.need_bytes = chunk.size() + 1;
                        }
                        break;
                }

                const auto *const bundle_start = p;
                const auto        bundle_len   = Compression::decode_varuint32(p);
                const auto        bundle_end   = p + bundle_len;

                if (trace) {
                        SLog("bundle_len = ", bundle_len, "(", size_repr(bundle_len), ") at ", std::distance(chunk_start, p), "\n");
                }

                if (bundle_len > std::distance(p, chunk_end)) {
                        // truncated; we need up to the end of this bundle
                        if (res.msgs.empty()) {
                                res.need_bytes = std::distance(chunk_start, bundle_end);
                        }
                        break;
                }

                if (unlikely(bundle_len < bundle_hdr_min_size)) {
                        if (!res.msgs.empty()) {
                                res.stopped_early = true;
                                break;
                        }

                        throw corrupt_message("Bundle at ", std::distance(chunk_start, bundle_start), " is too short (", bundle_len, ")");
                }

                res.max_bundle_size = std::max<uint64_t>(res.max_bundle_size, std::distance(bundle_start, bundle_end));

                // BEGIN: bundle header
                const auto bundle_hdr_flags = decode_pod<uint8_t>(p);
                const auto codec            = Compression::algo_from_bundle_flags(bundle_hdr_flags);
                const auto base_offset      = decode_pod<uint64_t>(p);

                if (unlikely(!Compression::check_decode_varuint32(p, bundle_end))) {
                        if (!res.msgs.empty()) {
                                res.stopped_early = true;
                                break;
                        }

                        throw corrupt_message("Unable to decode msgs_cnt of bundle at offset ", base_offset);
                }

                const auto msgs_cnt = Compression::decode_varuint32(p);
                // END: bundle header

                if (trace) {
                        SLog("codec = ", codec, ", base_offset = ", base_offset, ", msgs_cnt = ", msgs_cnt, "\n");
                }

                std::vector<consumed_msg> msgs;

                try {
                        msgs = decode(std::string_view(reinterpret_cast<const char *>(p), std::distance(p, bundle_end)), codec, base_offset, msgs_cnt);
                } catch (const unsupported_codec &) {
                        if (res.msgs.empty()) {
                                throw;
                        }

                        // return what we have; the next fetch starts at this bundle and will fail there
                        res.stopped_early = true;
                        break;
                } catch (const corrupt_message &) {
                        if (res.msgs.empty()) {
                                throw;
                        }

                        res.stopped_early = true;
                        break;
                }

                p = bundle_end;

                for (auto &m : msgs) {
                        if (m.offset >= high_water_mark) {
                                if (trace) {
                                        SLog("Past HW mark ", high_water_mark, "\n");
                                }

                                return res;
                        } else if (m.offset >= min_offset) {
                                res.msgs.emplace_back(std::move(m));
                        }
                }
        }

        return res;
}

void Sluice::encode_bundle(std::string *out, const Compression::Algo codec, const uint64_t base_offset,
                           const std::vector<consumed_msg> &msgs) {
        std::string msgset;
        std::string body;
        uint8_t     buf[16];
        uint64_t    next_offset = base_offset;

        for (size_t i{0}; i < msgs.size(); ++i) {
                const auto &m         = msgs[i];
                uint8_t     msg_flags = 0;

                if (m.offset < next_offset) {
                        throw invalid_argument("Message offsets must be ascending and >= base_offset");
                } else if (m.key.size() > std::numeric_limits<uint8_t>::max()) {
                        throw invalid_argument("Key of message at ", m.offset, " is too long");
                }

                if (m.offset != next_offset) {
                        msg_flags |= unsigned(SluiceFlags::BundleMsgFlags::HaveOffsetDelta);
                }
                if (i && m.ts == msgs[i - 1].ts) {
                        msg_flags |= unsigned(SluiceFlags::BundleMsgFlags::UseLastSpecifiedTS);
                }
                if (!m.key.empty()) {
                        msg_flags |= unsigned(SluiceFlags::BundleMsgFlags::HaveKey);
                }

                msgset.push_back(msg_flags);

                if (msg_flags & unsigned(SluiceFlags::BundleMsgFlags::HaveOffsetDelta)) {
                        msgset.append(reinterpret_cast<const char *>(buf), Compression::encode_varuint32(m.offset - next_offset, buf) - buf);
                }
                if (0 == (msg_flags & unsigned(SluiceFlags::BundleMsgFlags::UseLastSpecifiedTS))) {
                        msgset.append(reinterpret_cast<const char *>(&m.ts), sizeof(m.ts));
                }
                if (msg_flags & unsigned(SluiceFlags::BundleMsgFlags::HaveKey)) {
                        msgset.push_back(m.key.size());
                        msgset.append(m.key);
                }

                msgset.append(reinterpret_cast<const char *>(buf), Compression::encode_varuint32(m.value.size(), buf) - buf);
                msgset.append(m.value);
                next_offset = m.offset + 1;
        }

        body.push_back(static_cast<uint8_t>(codec) & 3);
        body.append(reinterpret_cast<const char *>(&base_offset), sizeof(base_offset));
        body.append(reinterpret_cast<const char *>(buf), Compression::encode_varuint32(msgs.size(), buf) - buf);

        if (codec == Compression::Algo::NONE) {
                body.append(msgset);
        } else if (!Compression::Compress(codec, msgset.data(), msgset.size(), &body)) {
                throw exception("Failed to compress message set (", codec, ")");
        }

        out->append(reinterpret_cast<const char *>(buf), Compression::encode_varuint32(body.size(), buf) - buf);
        out->append(body);
}
