#include "celio/io/chunking.hpp"

#include <algorithm>
#include <cmath>

namespace celio {

std::vector<Size> guess_chunks(const std::vector<Size>& shape, Size itemsize) {
    if (shape.empty()) return {};

    const Size ndims = shape.size();
    std::vector<double> chunks(ndims);
    for (Size i = 0; i < ndims; ++i) {
        chunks[i] = shape[i] == 0 ? 1024.0 : static_cast<double>(shape[i]);
    }

    auto product = [&chunks]() {
        double p = 1.0;
        for (double c : chunks) p *= c;
        return p;
    };

    const auto base = static_cast<double>(config::kChunkBase);
    const auto lo = static_cast<double>(config::kChunkMin);
    const auto hi = static_cast<double>(config::kChunkMax);
    const double item = static_cast<double>(std::max<Size>(itemsize, 1));

    const double dset_size = product() * item;
    double target = base * std::pow(2.0, std::log10(dset_size / (1024.0 * 1024.0)));
    target = std::clamp(target, lo, hi);

    Size idx = 0;
    while (true) {
        const double chunk_bytes = product() * item;
        const bool close_enough = chunk_bytes < target ||
                                  std::abs(chunk_bytes - target) / target < 0.5;
        if (close_enough && chunk_bytes < hi) break;
        if (product() == 1.0) break;
        const Size axis = idx % ndims;
        chunks[axis] = std::ceil(chunks[axis] / 2.0);
        ++idx;
    }

    std::vector<Size> out(ndims);
    for (Size i = 0; i < ndims; ++i) out[i] = static_cast<Size>(chunks[i]);
    return out;
}

std::vector<Size> chunk_grid(const std::vector<Size>& shape, const std::vector<Size>& chunks) {
    std::vector<Size> grid(shape.size());
    for (Size i = 0; i < shape.size(); ++i) {
        grid[i] = chunks[i] == 0 ? 0 : (shape[i] + chunks[i] - 1) / chunks[i];
    }
    return grid;
}

} // namespace celio
