#pragma once

#include "celio/core/column.hpp"
#include "celio/core/dense.hpp"
#include "celio/core/sparse.hpp"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// =============================================================================
// FILE: celio/core/element.hpp
// BRIEF: Closed in-memory value model handled by the codec
//
// Element is a tagged variant over every shape the codec can store. The
// registry dispatches on the variant discriminant (ElementType) refined by
// the element kind of array-like values.
//
// Containers holding Elements (Mapping, DataFrame) only declare their
// Element-dependent members here; definitions live in element.cpp where
// Element is complete.
// =============================================================================

namespace celio {

class Element;

// =============================================================================
// Mapping
// =============================================================================

/// Ordered string-keyed collection of Elements.
class Mapping {
public:
    Mapping();
    Mapping(std::initializer_list<std::pair<std::string, Element>> entries);
    Mapping(const Mapping&);
    Mapping(Mapping&&) noexcept;
    Mapping& operator=(const Mapping&);
    Mapping& operator=(Mapping&&) noexcept;
    ~Mapping();

    [[nodiscard]] Size size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] bool contains(const std::string& key) const noexcept;

    /// Throws ValueError for an unknown key.
    [[nodiscard]] const Element& at(const std::string& key) const;
    [[nodiscard]] const Element& value(Size i) const;

    /// Insert or replace. Replacing keeps the original position.
    void insert(std::string key, Element value);
    void erase(const std::string& key);

    friend bool operator==(const Mapping& a, const Mapping& b);

private:
    std::vector<std::string> keys_;
    std::vector<Element> values_;
};

// =============================================================================
// DataFrame
// =============================================================================

/// Ordered named columns sharing an index. Columns are 1-D array-like
/// Elements (DenseArray, Categorical or NullableArray).
class DataFrame {
public:
    /// Zero rows, empty text index.
    DataFrame();
    explicit DataFrame(DenseArray index, std::optional<std::string> index_name = std::nullopt);
    DataFrame(const DataFrame&);
    DataFrame(DataFrame&&) noexcept;
    DataFrame& operator=(const DataFrame&);
    DataFrame& operator=(DataFrame&&) noexcept;
    ~DataFrame();

    [[nodiscard]] Size num_rows() const noexcept { return index_.size(); }
    [[nodiscard]] Size num_columns() const noexcept { return names_.size(); }
    [[nodiscard]] const DenseArray& index() const noexcept { return index_; }
    [[nodiscard]] const std::optional<std::string>& index_name() const noexcept { return index_name_; }
    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept { return names_; }
    [[nodiscard]] bool has_column(const std::string& name) const noexcept;

    [[nodiscard]] const Element& column(const std::string& name) const;
    [[nodiscard]] const Element& column(Size i) const;

    /// Append (or replace) a column; its length must equal num_rows().
    void add_column(std::string name, Element column);

    /// Columns in the requested order; unknown names raise ValueError.
    [[nodiscard]] DataFrame select_columns(const std::vector<std::string>& names) const;

    /// Rows selected uniformly from the index and every column.
    [[nodiscard]] DataFrame take_rows(const AxisSelector& rows) const;

    friend bool operator==(const DataFrame& a, const DataFrame& b);

private:
    DenseArray index_;
    std::optional<std::string> index_name_;
    std::vector<std::string> names_;
    std::vector<Element> columns_;
};

// =============================================================================
// AnnData / Raw
// =============================================================================

/// Frozen copy of X / var / varm kept alongside a container.
struct Raw {
    std::shared_ptr<const Element> X;
    DataFrame var;
    Mapping varm;

    friend bool operator==(const Raw& a, const Raw& b);
};

/// Annotated data matrix: X with obs (rows) and var (columns) annotations.
/// `dtype` is derived from X when read and is not part of equality.
struct AnnData {
    std::shared_ptr<const Element> X;
    DataFrame obs;
    DataFrame var;
    Mapping obsm;
    Mapping varm;
    Mapping obsp;
    Mapping varp;
    Mapping layers;
    Mapping uns;
    std::shared_ptr<const Raw> raw;
    std::optional<DType> dtype;

    [[nodiscard]] Size n_obs() const noexcept { return obs.num_rows(); }
    [[nodiscard]] Size n_vars() const noexcept { return var.num_rows(); }

    friend bool operator==(const AnnData& a, const AnnData& b);
};

// =============================================================================
// Element
// =============================================================================

/// Writer dispatch discriminant. Follows the variant alternatives, except
/// that sparse matrices and nullable arrays are split by format / flavour
/// since each is stored under its own encoding.
enum class ElementType : std::uint8_t {
    Mapping,
    DenseArray,
    RecordArray,
    CsrMatrix,
    CscMatrix,
    DataFrame,
    Categorical,
    NullableInteger,
    NullableBoolean,
    Scalar,
    String,
    Bytes,
    AnnData,
    Raw,
};

[[nodiscard]] const char* element_type_name(ElementType t) noexcept;

class Element {
public:
    using Value = std::variant<
        Mapping, DenseArray, RecordArray, SparseMatrix, DataFrame, Categorical,
        NullableArray, Scalar, std::string, Bytes, AnnData, Raw>;

    Element() : value_(Mapping{}) {}

    template <typename T>
        requires (!std::is_same_v<std::remove_cvref_t<T>, Element> &&
                  std::is_constructible_v<Value, T>)
    Element(T&& value) : value_(std::forward<T>(value)) {}  // NOLINT(*-explicit-*)

    Element(const char* text) : value_(std::string(text)) {}  // NOLINT(*-explicit-*)

    [[nodiscard]] ElementType type() const noexcept;

    /// Refinement used for writer dispatch; only array-like values have one.
    [[nodiscard]] std::optional<ElementKind> element_kind() const noexcept;

    /// Human readable runtime type, e.g. "DenseArray[str]".
    [[nodiscard]] std::string type_name() const;

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(value_); }

    template <typename T>
    [[nodiscard]] const T& as() const {
        if (const T* p = std::get_if<T>(&value_)) return *p;
        throw TypeMismatchError("Element holds " + type_name());
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&value_); }

    [[nodiscard]] const Value& value() const noexcept { return value_; }

    friend bool operator==(const Element& a, const Element& b) { return a.value_ == b.value_; }

private:
    Value value_;
};

// =============================================================================
// Column Helpers
// =============================================================================

/// Length of a 1-D array-like Element (DenseArray, Categorical, NullableArray).
[[nodiscard]] Size column_length(const Element& column);

/// Row selection applied to a 1-D array-like Element.
[[nodiscard]] Element take_rows(const Element& column, const AxisSelector& rows);

} // namespace celio
