#include "celio/core/selection.hpp"
#include "celio/core/error.hpp"

#include <algorithm>
#include <string>

namespace celio {

bool AxisSelection::is_monotone() const noexcept {
    if (is_range) return true;
    for (Size i = 1; i < positions.size(); ++i) {
        if (positions[i] <= positions[i - 1]) return false;
    }
    return true;
}

AxisSelection resolve_selector(const AxisSelector& sel, Size extent) {
    const auto n = static_cast<Index>(extent);
    AxisSelection out;

    if (const auto* s = std::get_if<Slice>(&sel)) {
        CELIO_CHECK_ARG(s->step > 0, "slice step must be positive");

        auto clamp = [n](std::optional<Index> v, Index dflt) -> Index {
            if (!v) return dflt;
            Index x = *v;
            if (x < 0) x += n;
            return std::clamp<Index>(x, 0, n);
        };

        const Index start = clamp(s->start, 0);
        const Index stop = clamp(s->stop, n);
        out.is_range = true;
        out.start = static_cast<Size>(start);
        out.step = static_cast<Size>(s->step);
        out.count = stop > start
            ? static_cast<Size>((stop - start + s->step - 1) / s->step)
            : 0;
        return out;
    }

    const auto& list = std::get<std::vector<Index>>(sel);
    out.is_range = false;
    out.positions.reserve(list.size());
    for (Index i : list) {
        Index x = i < 0 ? i + n : i;
        if (x < 0 || x >= n) {
            throw IndexOutOfBoundsError(
                "index " + std::to_string(i) + " is out of bounds for axis with size " +
                std::to_string(extent));
        }
        out.positions.push_back(static_cast<Size>(x));
    }
    return out;
}

std::vector<AxisSelection> resolve_indices(
    const Indices& indices, const std::vector<Size>& shape)
{
    if (indices.size() > shape.size()) {
        throw IndexOutOfBoundsError(
            "too many indices: array is " + std::to_string(shape.size()) +
            "-dimensional, but " + std::to_string(indices.size()) + " were indexed");
    }

    std::vector<AxisSelection> out;
    out.reserve(shape.size());
    for (Size axis = 0; axis < shape.size(); ++axis) {
        if (axis < indices.size()) {
            out.push_back(resolve_selector(indices[axis], shape[axis]));
        } else {
            out.push_back(resolve_selector(Slice::all(), shape[axis]));
        }
    }
    return out;
}

bool is_full_selection(const Indices& indices) noexcept {
    return std::all_of(indices.begin(), indices.end(), [](const AxisSelector& s) {
        const auto* slice = std::get_if<Slice>(&s);
        return slice != nullptr && slice->is_full();
    });
}

Indices axis0(const AxisSelector& sel) {
    return Indices{sel};
}

Size selection_volume(const std::vector<AxisSelection>& sel) noexcept {
    Size v = 1;
    for (const auto& s : sel) v *= s.size();
    return v;
}

std::vector<Size> selection_shape(const std::vector<AxisSelection>& sel) {
    std::vector<Size> shape;
    shape.reserve(sel.size());
    for (const auto& s : sel) shape.push_back(s.size());
    return shape;
}

} // namespace celio
