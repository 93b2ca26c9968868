#pragma once

#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: celio/config.hpp
// BRIEF: celio Core Configuration Header
// =============================================================================

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define CELIO_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define CELIO_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define CELIO_OS_LINUX
#else
    #define CELIO_OS_UNKNOWN
#endif

// =============================================================================
// Library Version
// =============================================================================

#define CELIO_VERSION_MAJOR 0
#define CELIO_VERSION_MINOR 3
#define CELIO_VERSION_PATCH 0
#define CELIO_VERSION_STRING "0.3.0"

// =============================================================================
// Chunking Heuristics
// =============================================================================

// Target size of an automatically chosen chunk (bytes)
#ifndef CELIO_CHUNK_BASE
#define CELIO_CHUNK_BASE (16 * 1024)
#endif

#ifndef CELIO_CHUNK_MIN
#define CELIO_CHUNK_MIN (8 * 1024)
#endif

#ifndef CELIO_CHUNK_MAX
#define CELIO_CHUNK_MAX (1024 * 1024)
#endif

// Default deflate / zstd levels when a compressor is requested without level
#ifndef CELIO_DEFAULT_GZIP_LEVEL
#define CELIO_DEFAULT_GZIP_LEVEL 4
#endif

#ifndef CELIO_DEFAULT_ZSTD_LEVEL
#define CELIO_DEFAULT_ZSTD_LEVEL 3
#endif

namespace celio::config {

inline constexpr const char* kVersion = CELIO_VERSION_STRING;

// Metadata attribute names stamped on every written node
inline constexpr const char* kEncodingTypeAttr = "encoding-type";
inline constexpr const char* kEncodingVersionAttr = "encoding-version";

// Table layout
inline constexpr const char* kReservedIndexName = "_index";
inline constexpr const char* kColumnOrderAttr = "column-order";
inline constexpr const char* kIndexAttr = "_index";

// Sparse / categorical layout
inline constexpr const char* kShapeAttr = "shape";
inline constexpr const char* kOrderedAttr = "ordered";

// Legacy markers
inline constexpr const char* kLegacySparseAttr = "h5sparse_format";
inline constexpr const char* kLegacySparseShapeAttr = "h5sparse_shape";
inline constexpr const char* kLegacyCategoriesAttr = "categories";
inline constexpr const char* kLegacyOrderedAttr = "ordered";

inline constexpr std::size_t kChunkBase = CELIO_CHUNK_BASE;
inline constexpr std::size_t kChunkMin = CELIO_CHUNK_MIN;
inline constexpr std::size_t kChunkMax = CELIO_CHUNK_MAX;

inline constexpr int kDefaultGzipLevel = CELIO_DEFAULT_GZIP_LEVEL;
inline constexpr int kDefaultZstdLevel = CELIO_DEFAULT_ZSTD_LEVEL;

static_assert(kChunkMin <= kChunkBase && kChunkBase <= kChunkMax,
    "CELIO_CHUNK_BASE must lie within [CELIO_CHUNK_MIN, CELIO_CHUNK_MAX]");

static_assert(kDefaultGzipLevel >= 0 && kDefaultGzipLevel <= 9,
    "CELIO_DEFAULT_GZIP_LEVEL must be in [0, 9]");

} // namespace celio::config
