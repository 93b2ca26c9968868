#include "celio/core/element.hpp"

#include <algorithm>

namespace celio {

// =============================================================================
// Mapping
// =============================================================================

Mapping::Mapping() = default;
Mapping::Mapping(const Mapping&) = default;
Mapping::Mapping(Mapping&&) noexcept = default;
Mapping& Mapping::operator=(const Mapping&) = default;
Mapping& Mapping::operator=(Mapping&&) noexcept = default;
Mapping::~Mapping() = default;

Mapping::Mapping(std::initializer_list<std::pair<std::string, Element>> entries) {
    for (const auto& [key, value] : entries) insert(key, value);
}

bool Mapping::contains(const std::string& key) const noexcept {
    return std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

const Element& Mapping::at(const std::string& key) const {
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) throw ValueError("mapping has no key '" + key + "'");
    return values_[static_cast<Size>(it - keys_.begin())];
}

const Element& Mapping::value(Size i) const {
    CELIO_CHECK_BOUNDS(static_cast<Index>(i), values_.size(), "Mapping::value: index out of range");
    return values_[i];
}

void Mapping::insert(std::string key, Element value) {
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it != keys_.end()) {
        values_[static_cast<Size>(it - keys_.begin())] = std::move(value);
        return;
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
}

void Mapping::erase(const std::string& key) {
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) return;
    const auto pos = it - keys_.begin();
    keys_.erase(it);
    values_.erase(values_.begin() + pos);
}

bool operator==(const Mapping& a, const Mapping& b) {
    if (a.size() != b.size()) return false;
    // key order is not part of mapping equality
    for (Size i = 0; i < a.size(); ++i) {
        if (!b.contains(a.keys_[i])) return false;
        if (!(a.values_[i] == b.at(a.keys_[i]))) return false;
    }
    return true;
}

// =============================================================================
// DataFrame
// =============================================================================

DataFrame::DataFrame()
    : index_(DType::String, {0})
{}

DataFrame::DataFrame(DenseArray index, std::optional<std::string> index_name)
    : index_(std::move(index)), index_name_(std::move(index_name))
{
    CELIO_CHECK_DIM(index_.rank() == 1, "dataframe index must be 1-D");
}

DataFrame::DataFrame(const DataFrame&) = default;
DataFrame::DataFrame(DataFrame&&) noexcept = default;
DataFrame& DataFrame::operator=(const DataFrame&) = default;
DataFrame& DataFrame::operator=(DataFrame&&) noexcept = default;
DataFrame::~DataFrame() = default;

bool DataFrame::has_column(const std::string& name) const noexcept {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

const Element& DataFrame::column(const std::string& name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) throw ValueError("dataframe has no column '" + name + "'");
    return columns_[static_cast<Size>(it - names_.begin())];
}

const Element& DataFrame::column(Size i) const {
    CELIO_CHECK_BOUNDS(static_cast<Index>(i), columns_.size(), "DataFrame::column: index out of range");
    return columns_[i];
}

void DataFrame::add_column(std::string name, Element column) {
    const Size n = column_length(column);
    CELIO_CHECK_DIM(n == num_rows(),
                    "column '" + name + "' has length " + std::to_string(n) +
                    ", dataframe has " + std::to_string(num_rows()) + " rows");
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it != names_.end()) {
        columns_[static_cast<Size>(it - names_.begin())] = std::move(column);
        return;
    }
    names_.push_back(std::move(name));
    columns_.push_back(std::move(column));
}

DataFrame DataFrame::select_columns(const std::vector<std::string>& names) const {
    DataFrame out(index_, index_name_);
    for (const auto& name : names) out.add_column(name, column(name));
    return out;
}

DataFrame DataFrame::take_rows(const AxisSelector& rows) const {
    DataFrame out(index_.take(axis0(rows)), index_name_);
    for (Size i = 0; i < names_.size(); ++i) {
        out.add_column(names_[i], celio::take_rows(columns_[i], rows));
    }
    return out;
}

bool operator==(const DataFrame& a, const DataFrame& b) {
    return a.index_ == b.index_ && a.index_name_ == b.index_name_ &&
           a.names_ == b.names_ && a.columns_ == b.columns_;
}

// =============================================================================
// AnnData / Raw
// =============================================================================

namespace {

bool same_matrix(const std::shared_ptr<const Element>& a,
                 const std::shared_ptr<const Element>& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

} // namespace

bool operator==(const Raw& a, const Raw& b) {
    return same_matrix(a.X, b.X) && a.var == b.var && a.varm == b.varm;
}

bool operator==(const AnnData& a, const AnnData& b) {
    if (!same_matrix(a.X, b.X)) return false;
    if (!(a.obs == b.obs && a.var == b.var)) return false;
    if (!(a.obsm == b.obsm && a.varm == b.varm)) return false;
    if (!(a.obsp == b.obsp && a.varp == b.varp)) return false;
    if (!(a.layers == b.layers && a.uns == b.uns)) return false;
    if (!a.raw || !b.raw) return !a.raw && !b.raw;
    return *a.raw == *b.raw;
}

// =============================================================================
// Element
// =============================================================================

const char* element_type_name(ElementType t) noexcept {
    switch (t) {
        case ElementType::Mapping:       return "Mapping";
        case ElementType::DenseArray:    return "DenseArray";
        case ElementType::RecordArray:   return "RecordArray";
        case ElementType::CsrMatrix:     return "CsrMatrix";
        case ElementType::CscMatrix:     return "CscMatrix";
        case ElementType::DataFrame:     return "DataFrame";
        case ElementType::Categorical:   return "Categorical";
        case ElementType::NullableInteger: return "NullableInteger";
        case ElementType::NullableBoolean: return "NullableBoolean";
        case ElementType::Scalar:        return "Scalar";
        case ElementType::String:        return "String";
        case ElementType::Bytes:         return "Bytes";
        case ElementType::AnnData:       return "AnnData";
        case ElementType::Raw:           return "Raw";
    }
    return "Unknown";
}

ElementType Element::type() const noexcept {
    return std::visit([](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Mapping>) return ElementType::Mapping;
        else if constexpr (std::is_same_v<V, DenseArray>) return ElementType::DenseArray;
        else if constexpr (std::is_same_v<V, RecordArray>) return ElementType::RecordArray;
        else if constexpr (std::is_same_v<V, SparseMatrix>) {
            return v.format() == SparseFormat::Csr ? ElementType::CsrMatrix : ElementType::CscMatrix;
        }
        else if constexpr (std::is_same_v<V, DataFrame>) return ElementType::DataFrame;
        else if constexpr (std::is_same_v<V, Categorical>) return ElementType::Categorical;
        else if constexpr (std::is_same_v<V, NullableArray>) {
            return v.kind() == NullableKind::Integer ? ElementType::NullableInteger
                                                     : ElementType::NullableBoolean;
        }
        else if constexpr (std::is_same_v<V, Scalar>) return ElementType::Scalar;
        else if constexpr (std::is_same_v<V, std::string>) return ElementType::String;
        else if constexpr (std::is_same_v<V, Bytes>) return ElementType::Bytes;
        else if constexpr (std::is_same_v<V, AnnData>) return ElementType::AnnData;
        else return ElementType::Raw;
    }, value_);
}

std::optional<ElementKind> Element::element_kind() const noexcept {
    if (const auto* a = std::get_if<DenseArray>(&value_)) return a->kind();
    if (is<RecordArray>()) return ElementKind::Record;
    return std::nullopt;
}

std::string Element::type_name() const {
    std::string name = element_type_name(type());
    if (const auto* a = std::get_if<DenseArray>(&value_)) {
        name += '[';
        name += dtype_name(a->dtype());
        name += ']';
    }
    return name;
}

// =============================================================================
// Column Helpers
// =============================================================================

Size column_length(const Element& column) {
    if (const auto* a = column.get_if<DenseArray>()) {
        CELIO_CHECK_DIM(a->rank() == 1, "dataframe columns must be 1-D");
        return a->size();
    }
    if (const auto* c = column.get_if<Categorical>()) return c->size();
    if (const auto* n = column.get_if<NullableArray>()) return n->size();
    throw TypeError("unsupported dataframe column type " + column.type_name());
}

Element take_rows(const Element& column, const AxisSelector& rows) {
    if (const auto* a = column.get_if<DenseArray>()) return a->take(axis0(rows));
    if (const auto* c = column.get_if<Categorical>()) return c->take(rows);
    if (const auto* n = column.get_if<NullableArray>()) return n->take(rows);
    throw TypeError("cannot take rows of " + column.type_name());
}

} // namespace celio
