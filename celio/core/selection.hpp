#pragma once

#include "celio/core/type.hpp"

#include <optional>
#include <variant>
#include <vector>

// =============================================================================
// FILE: celio/core/selection.hpp
// BRIEF: Per-axis index selectors for partial reads
//
// A selector is either a Slice (Python semantics: negative bounds count from
// the end and are clamped, step must be positive) or an explicit list of
// integer positions (any order, repeats allowed, negatives wrap once).
// Indices holds one selector per axis; missing trailing axes mean "all".
// =============================================================================

namespace celio {

struct Slice {
    std::optional<Index> start;
    std::optional<Index> stop;
    Index step = 1;

    static Slice all() noexcept { return Slice{}; }

    static Slice range(Index start, Index stop, Index step = 1) noexcept {
        return Slice{start, stop, step};
    }

    [[nodiscard]] bool is_full() const noexcept {
        return !start.has_value() && !stop.has_value() && step == 1;
    }

    bool operator==(const Slice&) const = default;
};

using AxisSelector = std::variant<Slice, std::vector<Index>>;
using Indices = std::vector<AxisSelector>;

/// A selector resolved against a concrete extent.
struct AxisSelection {
    // Strided range form (valid when positions is empty and is_range is true)
    bool is_range = true;
    Size start = 0;
    Size count = 0;
    Size step = 1;
    // Explicit positions, in request order
    std::vector<Size> positions;

    [[nodiscard]] Size size() const noexcept {
        return is_range ? count : positions.size();
    }

    [[nodiscard]] Size operator[](Size i) const noexcept {
        return is_range ? start + i * step : positions[i];
    }

    [[nodiscard]] bool covers(Size extent) const noexcept {
        return is_range && start == 0 && step == 1 && count == extent;
    }

    /// True when the selection is strictly increasing (readable as-is by
    /// backends that only accept monotone selections).
    [[nodiscard]] bool is_monotone() const noexcept;
};

/// Resolve one selector against an axis extent.
[[nodiscard]] AxisSelection resolve_selector(const AxisSelector& sel, Size extent);

/// Resolve a full Indices spec against a shape. Selectors beyond the rank
/// raise IndexOutOfBoundsError; missing axes select everything.
[[nodiscard]] std::vector<AxisSelection> resolve_indices(
    const Indices& indices, const std::vector<Size>& shape);

/// True when every axis selects the full extent.
[[nodiscard]] bool is_full_selection(const Indices& indices) noexcept;

/// Select a single axis, keeping the remaining axes full.
[[nodiscard]] Indices axis0(const AxisSelector& sel);

/// Number of elements in a resolved multi-axis selection.
[[nodiscard]] Size selection_volume(const std::vector<AxisSelection>& sel) noexcept;

/// Shape of the array produced by a resolved selection.
[[nodiscard]] std::vector<Size> selection_shape(const std::vector<AxisSelection>& sel);

} // namespace celio
