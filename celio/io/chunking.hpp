#pragma once

#include "celio/config.hpp"
#include "celio/core/type.hpp"

#include <vector>

// =============================================================================
// FILE: celio/io/chunking.hpp
// BRIEF: Automatic chunk shape selection
//
// Halves axes round-robin until a chunk is within 50% of a target size that
// grows with the dataset (CELIO_CHUNK_BASE scaled by log10 of the size in
// MiB, clamped to [CELIO_CHUNK_MIN, CELIO_CHUNK_MAX]). Zero-length axes are
// treated as 1024 so that resizable empty arrays get usable chunks.
// =============================================================================

namespace celio {

[[nodiscard]] std::vector<Size> guess_chunks(const std::vector<Size>& shape, Size itemsize);

/// Number of chunks along each axis.
[[nodiscard]] std::vector<Size> chunk_grid(const std::vector<Size>& shape,
                                           const std::vector<Size>& chunks);

} // namespace celio
