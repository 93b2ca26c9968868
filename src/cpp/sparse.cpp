#include "celio/core/sparse.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace celio {

namespace {

std::vector<Index> to_index_vector(const DenseArray& a) {
    std::vector<Index> out(a.size());
    for (Size i = 0; i < out.size(); ++i) out[i] = a.as_index(i);
    return out;
}

DenseArray index_array(const std::vector<Index>& values, DType dtype) {
    return DenseArray::from(values).astype(dtype);
}

struct Entry {
    Size minor;
    Size src;
};

} // namespace

SparseMatrix::SparseMatrix()
    : format_(SparseFormat::Csr), rows_(0), cols_(0),
      data_(DType::Float32, {0}),
      indices_(DType::Int32, {0}),
      indptr_(DenseArray::from(std::vector<std::int32_t>{0}))
{}

SparseMatrix::SparseMatrix(SparseFormat format, Size rows, Size cols,
                           DenseArray data, DenseArray indices, DenseArray indptr)
    : format_(format), rows_(rows), cols_(cols),
      data_(std::move(data)), indices_(std::move(indices)), indptr_(std::move(indptr))
{
    CELIO_CHECK_DIM(data_.rank() == 1 && indices_.rank() == 1 && indptr_.rank() == 1,
                    "sparse component arrays must be 1-D");
    CELIO_CHECK_DIM(data_.size() == indices_.size(),
                    "sparse data and indices must have the same length");
    CELIO_CHECK_DIM(indptr_.size() == major_extent() + 1,
                    "indptr length " + std::to_string(indptr_.size()) +
                    " does not match " + format_name() + " shape");
    if (is_text(data_.dtype())) {
        throw TypeError("sparse data must be numeric");
    }

    const auto ptr = to_index_vector(indptr_);
    CELIO_CHECK_ARG(ptr.front() == 0, "indptr must start at 0");
    CELIO_CHECK_ARG(static_cast<Size>(ptr.back()) == data_.size(),
                    "indptr must end at nnz");
    for (Size i = 1; i < ptr.size(); ++i) {
        CELIO_CHECK_ARG(ptr[i] >= ptr[i - 1], "indptr must be non-decreasing");
    }
    const Size minor = minor_extent();
    for (Size i = 0; i < indices_.size(); ++i) {
        CELIO_CHECK_BOUNDS(indices_.as_index(i), minor, "sparse index out of bounds");
    }
}

SparseMatrix SparseMatrix::empty(SparseFormat format, Size rows, Size cols, DType dtype) {
    const Size major = format == SparseFormat::Csr ? rows : cols;
    return SparseMatrix(format, rows, cols,
                        DenseArray(dtype, {0}),
                        DenseArray(DType::Int32, {0}),
                        DenseArray(DType::Int32, {major + 1}));
}

SparseMatrix SparseMatrix::from_dense(const DenseArray& dense, SparseFormat format) {
    CELIO_CHECK_DIM(dense.rank() == 2, "from_dense requires a 2-D array");
    const Size rows = dense.shape()[0];
    const Size cols = dense.shape()[1];
    const bool csr = format == SparseFormat::Csr;
    const Size major = csr ? rows : cols;
    const Size minor = csr ? cols : rows;
    const Size width = dtype_size(dense.dtype());

    std::vector<Index> indices;
    std::vector<Index> indptr{0};
    std::vector<Byte> bytes;
    for (Size m = 0; m < major; ++m) {
        for (Size n = 0; n < minor; ++n) {
            const Size flat = csr ? m * cols + n : n * cols + m;
            if (dense.as_double(flat) == 0.0) continue;
            indices.push_back(static_cast<Index>(n));
            const Byte* p = dense.raw() + flat * width;
            bytes.insert(bytes.end(), p, p + width);
        }
        indptr.push_back(static_cast<Index>(indices.size()));
    }

    DenseArray data(dense.dtype(), {indices.size()});
    if (!bytes.empty()) std::memcpy(data.raw(), bytes.data(), bytes.size());
    return SparseMatrix(format, rows, cols, std::move(data),
                        index_array(indices, DType::Int32),
                        index_array(indptr, DType::Int32));
}

SparseMatrix SparseMatrix::slice(const Indices& indices) const {
    const auto sel = resolve_indices(indices, {rows_, cols_});
    return slice(sel[0], sel[1]);
}

SparseMatrix SparseMatrix::slice(const AxisSelection& rows, const AxisSelection& cols) const {
    const bool csr = format_ == SparseFormat::Csr;
    const AxisSelection& major = csr ? rows : cols;
    const AxisSelection& minor = csr ? cols : rows;

    SparseMatrix out = major.covers(major_extent()) ? *this : take_major(major);
    if (!minor.covers(minor_extent())) out = out.take_minor(minor);
    return out;
}

SparseMatrix SparseMatrix::take_major(const AxisSelection& major) const {
    const auto ptr = to_index_vector(indptr_);
    const Size width = dtype_size(data_.dtype());

    std::vector<Index> new_ptr{0};
    std::vector<Size> src;
    new_ptr.reserve(major.size() + 1);
    for (Size i = 0; i < major.size(); ++i) {
        const Size m = major[i];
        for (auto k = ptr[m]; k < ptr[m + 1]; ++k) src.push_back(static_cast<Size>(k));
        new_ptr.push_back(static_cast<Index>(src.size()));
    }

    DenseArray data(data_.dtype(), {src.size()});
    DenseArray indices(indices_.dtype(), {src.size()});
    const Size iw = dtype_size(indices_.dtype());
    for (Size k = 0; k < src.size(); ++k) {
        std::memcpy(data.raw() + k * width, data_.raw() + src[k] * width, width);
        std::memcpy(indices.raw() + k * iw, indices_.raw() + src[k] * iw, iw);
    }

    const bool csr = format_ == SparseFormat::Csr;
    return SparseMatrix(format_,
                        csr ? major.size() : rows_,
                        csr ? cols_ : major.size(),
                        std::move(data), std::move(indices),
                        index_array(new_ptr, indptr_.dtype()));
}

SparseMatrix SparseMatrix::take_minor(const AxisSelection& minor) const {
    // old minor position -> output positions (a position may be selected twice)
    std::vector<std::vector<Size>> remap(minor_extent());
    for (Size j = 0; j < minor.size(); ++j) remap[minor[j]].push_back(j);

    const auto ptr = to_index_vector(indptr_);
    const auto idx = to_index_vector(indices_);
    const Size width = dtype_size(data_.dtype());

    std::vector<Index> new_ptr{0};
    std::vector<Index> new_idx;
    std::vector<Size> src;
    std::vector<Entry> row;
    for (Size m = 0; m + 1 < ptr.size(); ++m) {
        row.clear();
        for (auto k = ptr[m]; k < ptr[m + 1]; ++k) {
            for (Size out_pos : remap[static_cast<Size>(idx[k])]) {
                row.push_back({out_pos, static_cast<Size>(k)});
            }
        }
        std::stable_sort(row.begin(), row.end(),
                         [](const Entry& a, const Entry& b) { return a.minor < b.minor; });
        for (const auto& e : row) {
            new_idx.push_back(static_cast<Index>(e.minor));
            src.push_back(e.src);
        }
        new_ptr.push_back(static_cast<Index>(new_idx.size()));
    }

    DenseArray data(data_.dtype(), {src.size()});
    for (Size k = 0; k < src.size(); ++k) {
        std::memcpy(data.raw() + k * width, data_.raw() + src[k] * width, width);
    }

    const bool csr = format_ == SparseFormat::Csr;
    return SparseMatrix(format_,
                        csr ? rows_ : minor.size(),
                        csr ? minor.size() : cols_,
                        std::move(data),
                        index_array(new_idx, indices_.dtype()),
                        index_array(new_ptr, indptr_.dtype()));
}

DenseArray SparseMatrix::to_dense() const {
    DenseArray out(data_.dtype(), {rows_, cols_});
    const auto ptr = to_index_vector(indptr_);
    const auto idx = to_index_vector(indices_);
    const Size width = dtype_size(data_.dtype());
    const bool csr = format_ == SparseFormat::Csr;

    for (Size m = 0; m + 1 < ptr.size(); ++m) {
        for (auto k = ptr[m]; k < ptr[m + 1]; ++k) {
            const auto n = static_cast<Size>(idx[k]);
            const Size flat = csr ? m * cols_ + n : n * cols_ + m;
            std::memcpy(out.raw() + flat * width, data_.raw() + k * width, width);
        }
    }
    return out;
}

bool operator==(const SparseMatrix& a, const SparseMatrix& b) {
    return a.format_ == b.format_ && a.rows_ == b.rows_ && a.cols_ == b.cols_ &&
           a.data_ == b.data_ && a.indices_ == b.indices_ && a.indptr_ == b.indptr_;
}

} // namespace celio
