#include "compress.h"
#include "sluice_exceptions.h"
#include <lz4frame.h>
#include <snappy.h>
#include <zlib.h>

// a decompressed message set is never larger than that; anything larger is garbage
static constexpr size_t K_max_uncompressed_size{512 * 1024 * 1024};

const char *Compression::algo_name(const Algo a) noexcept {
        switch (a) {
                case Algo::NONE:
                        return "none";
                case Algo::SNAPPY:
                        return "snappy";
                case Algo::GZIP:
                        return "gzip";
                case Algo::LZ4:
                        return "lz4";
                default:
                        return "unknown";
        }
}

Compression::Algo Compression::algo_by_name(const std::string_view name) noexcept {
        if (name == "none") {
                return Algo::NONE;
        } else if (name == "snappy") {
                return Algo::SNAPPY;
        } else if (name == "gzip") {
                return Algo::GZIP;
        } else if (name == "lz4") {
                return Algo::LZ4;
        } else {
                return Algo::UNKNOWN;
        }
}

static bool snappy_uncompress(const uint8_t *source, const size_t sourceLen, std::string *const dest) {
        size_t outLen;

        if (unlikely(!snappy::GetUncompressedLength(reinterpret_cast<const char *>(source), sourceLen, &outLen))) {
                return false;
        } else if (unlikely(outLen > K_max_uncompressed_size)) {
                return false;
        }

        const auto base = dest->size();

        dest->resize(base + outLen);
        if (unlikely(!snappy::RawUncompress(reinterpret_cast<const char *>(source), sourceLen, dest->data() + base))) {
                dest->resize(base);
                return false;
        }

        return true;
}

static bool gzip_uncompress(const uint8_t *source, const size_t sourceLen, std::string *const dest) {
        static constexpr int default_windowbits           = 15;
        static constexpr int decode_with_header_detection = 32;
        const auto           base                         = dest->size();
        z_stream             zs;
        int                  r;

        memset(&zs, 0, sizeof(zs));
        if (inflateInit2(&zs, default_windowbits + decode_with_header_detection) != Z_OK) {
                return false;
        }

        DEFER({ inflateEnd(&zs); });

        zs.next_in  = const_cast<Bytef *>(source);
        zs.avail_in = sourceLen;

        do {
                const auto have = dest->size();

                if (have - base > K_max_uncompressed_size) {
                        dest->resize(base);
                        return false;
                }

                dest->resize(have + std::max<size_t>(sourceLen * 2, 4096));
                zs.next_out  = reinterpret_cast<Bytef *>(dest->data() + have);
                zs.avail_out = dest->size() - have;

                r = inflate(&zs, Z_NO_FLUSH);
                dest->resize(dest->size() - zs.avail_out);

                if (r != Z_OK && r != Z_STREAM_END) {
                        dest->resize(base);
                        return false;
                } else if (r == Z_OK && zs.avail_in == 0 && zs.avail_out) {
                        // input exhausted but the stream is incomplete
                        dest->resize(base);
                        return false;
                }
        } while (r != Z_STREAM_END);

        return true;
}

static bool lz4_uncompress(const uint8_t *source, const size_t sourceLen, std::string *const dest) {
        LZ4F_dctx *ctx;
        const auto base = dest->size();

        if (LZ4F_isError(LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION))) {
                return false;
        }

        DEFER({ LZ4F_freeDecompressionContext(ctx); });

        const auto *p = source;
        const auto  e = source + sourceLen;
        size_t      hint{1};

        while (p < e && hint) {
                const auto have = dest->size();

                if (have - base > K_max_uncompressed_size) {
                        dest->resize(base);
                        return false;
                }

                size_t in_size  = std::distance(p, e);
                size_t out_size = 64 * 1024;

                dest->resize(have + out_size);
                hint = LZ4F_decompress(ctx, dest->data() + have, &out_size, p, &in_size, nullptr);
                dest->resize(have + out_size);

                if (LZ4F_isError(hint)) {
                        dest->resize(base);
                        return false;
                }

                p += in_size;

                if (0 == in_size && 0 == out_size) {
                        // no progress
                        dest->resize(base);
                        return false;
                }
        }

        if (hint) {
                // frame is incomplete
                dest->resize(base);
                return false;
        }

        return true;
}

bool Compression::UnCompress(const Algo algorithm, const void *const source, const size_t sourceLen, std::string *const dest) {
        const auto p = static_cast<const uint8_t *>(source);

        switch (algorithm) {
                case Algo::NONE:
                        dest->append(reinterpret_cast<const char *>(p), sourceLen);
                        return true;

                case Algo::SNAPPY:
                        return snappy_uncompress(p, sourceLen, dest);

                case Algo::GZIP:
                        return gzip_uncompress(p, sourceLen, dest);

                case Algo::LZ4:
                        return lz4_uncompress(p, sourceLen, dest);

                default:
                        return false;
        }
}

bool Compression::Compress(const Algo algorithm, const void *data, const size_t dataLen, std::string *dest) {
        const auto base = dest->size();

        switch (algorithm) {
                case Algo::NONE:
                        dest->append(static_cast<const char *>(data), dataLen);
                        return true;

                case Algo::SNAPPY: {
                        size_t outLen = 0;

                        dest->resize(base + snappy::MaxCompressedLength(dataLen));
                        snappy::RawCompress(static_cast<const char *>(data), dataLen, dest->data() + base, &outLen);
                        dest->resize(base + outLen);
                        return true;
                }

                case Algo::GZIP: {
                        z_stream zs;

                        memset(&zs, 0, sizeof(zs));
                        // 15 + 16: gzip header and trailer, not raw zlib
                        if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
                                return false;
                        }

                        DEFER({ deflateEnd(&zs); });

                        dest->resize(base + deflateBound(&zs, dataLen) + 32);
                        zs.next_in   = static_cast<Bytef *>(const_cast<void *>(data));
                        zs.avail_in  = dataLen;
                        zs.next_out  = reinterpret_cast<Bytef *>(dest->data() + base);
                        zs.avail_out = dest->size() - base;

                        if (deflate(&zs, Z_FINISH) != Z_STREAM_END) {
                                dest->resize(base);
                                return false;
                        }

                        dest->resize(base + zs.total_out);
                        return true;
                }

                case Algo::LZ4: {
                        const auto bound = LZ4F_compressFrameBound(dataLen, nullptr);

                        dest->resize(base + bound);

                        const auto r = LZ4F_compressFrame(dest->data() + base, bound, data, dataLen, nullptr);

                        if (LZ4F_isError(r)) {
                                dest->resize(base);
                                return false;
                        }

                        dest->resize(base + r);
                        return true;
                }

                default:
                        return false;
        }
}

Compression::CodecRegistry::CodecRegistry()
    : codecs{
          {Algo::NONE, "none", [](const uint8_t *p, const size_t l, std::string *out) { return UnCompress(Algo::NONE, p, l, out); }, true},
          {Algo::SNAPPY, "snappy", snappy_uncompress, true},
          {Algo::GZIP, "gzip", gzip_uncompress, true},
          {Algo::LZ4, "lz4", lz4_uncompress, true},
      } {
}

void Compression::CodecRegistry::set_available(const Algo a, const bool v) {
        if (a == Algo::UNKNOWN) {
                throw Sluice::invalid_argument("Unknown compression codec");
        } else if (a == Algo::NONE) {
                // can't be disabled; there is nothing to decode
                return;
        }

        codecs[static_cast<uint8_t>(a)].available = v;
}

bool Compression::CodecRegistry::is_available(const Algo a) const noexcept {
        const auto i = static_cast<int8_t>(a);

        return i >= 0 && i < 4 && codecs[i].available;
}

void Compression::CodecRegistry::ensure_available(const Algo a) const {
        const auto i = static_cast<int8_t>(a);

        if (i < 0 || i >= 4) {
                throw Sluice::unsupported_codec("Unknown compression codec ", static_cast<int>(i));
        } else if (!codecs[i].available) {
                throw Sluice::unsupported_codec("Libraries for ", codecs[i].name, " compression codec not found");
        }
}

void Compression::CodecRegistry::decode(const Algo a, const uint8_t *content, const size_t len, std::string *out) const {
        ensure_available(a);

        const auto &c = codecs[static_cast<uint8_t>(a)];

        if (!c.decode(content, len, out)) {
                throw Sluice::corrupt_message("Failed to decompress ", len, " bytes of ", c.name, " content");
        }
}
