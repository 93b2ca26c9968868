#pragma once

#include "celio/core/dense.hpp"
#include "celio/core/selection.hpp"

#include <array>

// =============================================================================
// FILE: celio/core/sparse.hpp
// BRIEF: Compressed sparse matrices (CSR / CSC) with runtime-typed buffers
//
// DESIGN NOTES:
// - data / indices / indptr are kept as DenseArray so that the on-disk
//   integer widths (int32 or int64) survive a round trip unchanged
// - "major" is the compressed axis (rows for CSR, columns for CSC)
// - Slicing never densifies; duplicates and repeats in a selection are kept
// =============================================================================

namespace celio {

enum class SparseFormat : std::uint8_t {
    Csr,
    Csc,
};

[[nodiscard]] constexpr const char* sparse_format_name(SparseFormat f) noexcept {
    return f == SparseFormat::Csr ? "csr" : "csc";
}

class SparseMatrix {
public:
    /// Empty 0 x 0 CSR matrix.
    SparseMatrix();

    /// Validates indptr length, monotonicity and that indices fit the minor extent.
    SparseMatrix(SparseFormat format, Size rows, Size cols,
                 DenseArray data, DenseArray indices, DenseArray indptr);

    /// All-zero matrix with no stored entries.
    static SparseMatrix empty(SparseFormat format, Size rows, Size cols,
                              DType dtype = DType::Float32);

    /// Compress a 2-D numeric array, dropping exact zeros.
    static SparseMatrix from_dense(const DenseArray& dense, SparseFormat format);

    [[nodiscard]] SparseFormat format() const noexcept { return format_; }
    [[nodiscard]] const char* format_name() const noexcept { return sparse_format_name(format_); }
    [[nodiscard]] Size rows() const noexcept { return rows_; }
    [[nodiscard]] Size cols() const noexcept { return cols_; }
    [[nodiscard]] std::array<Size, 2> shape() const noexcept { return {rows_, cols_}; }
    [[nodiscard]] Size nnz() const noexcept { return data_.size(); }
    [[nodiscard]] DType dtype() const noexcept { return data_.dtype(); }

    [[nodiscard]] Size major_extent() const noexcept {
        return format_ == SparseFormat::Csr ? rows_ : cols_;
    }
    [[nodiscard]] Size minor_extent() const noexcept {
        return format_ == SparseFormat::Csr ? cols_ : rows_;
    }

    [[nodiscard]] const DenseArray& data() const noexcept { return data_; }
    [[nodiscard]] const DenseArray& indices() const noexcept { return indices_; }
    [[nodiscard]] const DenseArray& indptr() const noexcept { return indptr_; }

    /// Two-axis selection (rows, cols) in matrix coordinates.
    [[nodiscard]] SparseMatrix slice(const Indices& indices) const;
    [[nodiscard]] SparseMatrix slice(const AxisSelection& rows, const AxisSelection& cols) const;

    /// Selection along the compressed axis only.
    [[nodiscard]] SparseMatrix take_major(const AxisSelection& major) const;

    /// Selection along the uncompressed axis only.
    [[nodiscard]] SparseMatrix take_minor(const AxisSelection& minor) const;

    [[nodiscard]] DenseArray to_dense() const;

    /// Structural equality (format, shape, data, indices, indptr).
    friend bool operator==(const SparseMatrix& a, const SparseMatrix& b);

private:
    SparseFormat format_;
    Size rows_;
    Size cols_;
    DenseArray data_;
    DenseArray indices_;
    DenseArray indptr_;
};

} // namespace celio
