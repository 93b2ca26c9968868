#pragma once

#include "celio/core/type.hpp"
#include "celio/io/storage.hpp"

#include <span>
#include <string>
#include <vector>

// =============================================================================
// FILE: celio/io/codec.hpp
// BRIEF: Chunk compressors for the Zarr store (zlib / gzip via zlib, zstd)
// =============================================================================

namespace celio::codec {

/// Compress a chunk. Compression::None returns a copy.
[[nodiscard]] std::vector<Byte> compress(Compression c, int level, std::span<const Byte> in);

/// Decompress a chunk. `expected` is the decoded size when known, 0 otherwise.
/// Gzip input may carry either a zlib or a gzip header.
[[nodiscard]] std::vector<Byte> decompress(Compression c, std::span<const Byte> in,
                                           Size expected = 0);

/// Zarr codec id written to .zarray ("zlib", "zstd").
[[nodiscard]] const char* zarr_codec_id(Compression c) noexcept;

/// Parse a Zarr codec id; unknown ids raise FeatureUnavailableError.
[[nodiscard]] Compression parse_zarr_codec(const std::string& id);

} // namespace celio::codec
