#include "celio/io/codec.hpp"
#include "celio/config.hpp"

#include <zlib.h>
#include <zstd.h>

#include <cstring>
#include <memory>

namespace celio::codec {

namespace {

// =============================================================================
// zlib
// =============================================================================

std::vector<Byte> zlib_compress(std::span<const Byte> in, int level) {
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    std::vector<Byte> out(bound);

    uLongf out_len = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    if (rc != Z_OK) {
        throw WriteError("zlib compress2 failed (code " + std::to_string(rc) + ")");
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

std::vector<Byte> zlib_decompress(std::span<const Byte> in, Size expected) {
    z_stream strm{};
    // 15 window bits + 32: detect zlib or gzip header
    if (::inflateInit2(&strm, 15 + 32) != Z_OK) {
        throw ReadError("zlib inflateInit2 failed");
    }
    std::unique_ptr<z_stream, int (*)(z_streamp)> guard(&strm, ::inflateEnd);

    std::vector<Byte> out(expected > 0 ? expected : in.size() * 4 + 64);
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    strm.avail_in = static_cast<uInt>(in.size());

    Size produced = 0;
    while (true) {
        if (produced == out.size()) out.resize(out.size() * 2);
        strm.next_out = reinterpret_cast<Bytef*>(out.data() + produced);
        strm.avail_out = static_cast<uInt>(out.size() - produced);

        const int rc = ::inflate(&strm, Z_NO_FLUSH);
        produced = out.size() - strm.avail_out;
        if (rc == Z_STREAM_END) break;
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            throw ReadError("zlib inflate failed (code " + std::to_string(rc) + ")");
        }
        if (rc == Z_BUF_ERROR && strm.avail_in == 0) {
            throw ReadError("zlib stream is truncated");
        }
    }
    out.resize(produced);
    if (expected > 0 && produced != expected) {
        throw ReadError("zlib chunk decoded to " + std::to_string(produced) +
                        " bytes, expected " + std::to_string(expected));
    }
    return out;
}

// =============================================================================
// zstd
// =============================================================================

std::vector<Byte> zstd_compress(std::span<const Byte> in, int level) {
    std::vector<Byte> out(ZSTD_compressBound(in.size()));
    const std::size_t size = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), level);
    if (ZSTD_isError(size)) {
        throw WriteError(std::string("zstd compress failed: ") + ZSTD_getErrorName(size));
    }
    out.resize(size);
    return out;
}

std::vector<Byte> zstd_decompress(std::span<const Byte> in, Size expected) {
    std::unique_ptr<ZSTD_DCtx, std::size_t (*)(ZSTD_DCtx*)> ctx(ZSTD_createDCtx(), ZSTD_freeDCtx);
    if (!ctx) {
        throw RuntimeError("Failed to create ZSTD decompression context");
    }

    Size capacity = expected;
    if (capacity == 0) {
        const auto frame = ZSTD_getFrameContentSize(in.data(), in.size());
        if (frame == ZSTD_CONTENTSIZE_ERROR) throw ReadError("zstd: not a valid frame");
        if (frame != ZSTD_CONTENTSIZE_UNKNOWN) capacity = static_cast<Size>(frame);
    }

    if (capacity > 0 || expected > 0) {
        std::vector<Byte> out(capacity);
        const std::size_t size = ZSTD_decompressDCtx(ctx.get(), out.data(), out.size(),
                                                     in.data(), in.size());
        if (ZSTD_isError(size)) {
            throw ReadError(std::string("zstd decompress failed: ") + ZSTD_getErrorName(size));
        }
        out.resize(size);
        return out;
    }

    // frame without a content size: stream it out
    std::vector<Byte> out;
    std::vector<Byte> buf(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{in.data(), in.size(), 0};
    while (input.pos < input.size) {
        ZSTD_outBuffer output{buf.data(), buf.size(), 0};
        const std::size_t rc = ZSTD_decompressStream(ctx.get(), &output, &input);
        if (ZSTD_isError(rc)) {
            throw ReadError(std::string("zstd decompress failed: ") + ZSTD_getErrorName(rc));
        }
        out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(output.pos));
    }
    return out;
}

} // namespace

std::vector<Byte> compress(Compression c, int level, std::span<const Byte> in) {
    switch (c) {
        case Compression::None:
            return {in.begin(), in.end()};
        case Compression::Gzip:
            return zlib_compress(in, level < 0 ? config::kDefaultGzipLevel : level);
        case Compression::Zstd:
            return zstd_compress(in, level < 0 ? config::kDefaultZstdLevel : level);
    }
    throw InternalError("unknown compression");
}

std::vector<Byte> decompress(Compression c, std::span<const Byte> in, Size expected) {
    switch (c) {
        case Compression::None:
            return {in.begin(), in.end()};
        case Compression::Gzip:
            return zlib_decompress(in, expected);
        case Compression::Zstd:
            return zstd_decompress(in, expected);
    }
    throw InternalError("unknown compression");
}

const char* zarr_codec_id(Compression c) noexcept {
    switch (c) {
        case Compression::Gzip: return "zlib";
        case Compression::Zstd: return "zstd";
        case Compression::None: break;
    }
    return "";
}

Compression parse_zarr_codec(const std::string& id) {
    if (id == "zlib" || id == "gzip") return Compression::Gzip;
    if (id == "zstd") return Compression::Zstd;
    throw FeatureUnavailableError("unsupported zarr compressor '" + id + "'");
}

} // namespace celio::codec
