#include "celio/spec/registry.hpp"
#include "celio/config.hpp"
#include "celio/core/warning.hpp"

#include <array>
#include <memory>

namespace celio::spec {

namespace {

// =============================================================================
// Encodings
// =============================================================================

const Tag kLegacy{};
const Tag kDict{"dict", "0.1.0"};
const Tag kArray{"array", "0.2.0"};
const Tag kStringArray{"string-array", "0.2.0"};
const Tag kRecArray{"rec-array", "0.2.0"};
const Tag kCsrMatrix{"csr_matrix", "0.1.0"};
const Tag kCscMatrix{"csc_matrix", "0.1.0"};
const Tag kDataFrame{"dataframe", "0.2.0"};
const Tag kDataFrameLegacy{"dataframe", "0.1.0"};
const Tag kCategorical{"categorical", "0.2.0"};
const Tag kNullableInteger{"nullable-integer", "0.1.0"};
const Tag kNullableBoolean{"nullable-boolean", "0.1.0"};
const Tag kNumericScalar{"numeric-scalar", "0.2.0"};
const Tag kString{"string", "0.2.0"};
const Tag kBytes{"bytes", "0.2.0"};
const Tag kAnnData{"anndata", "0.1.0"};
const Tag kRaw{"raw", "0.1.0"};

// =============================================================================
// Helpers
// =============================================================================

// readers are registered per node kind, so these casts never see the wrong kind
const GroupNode& as_group(const Node& node) {
    return static_cast<const GroupNode&>(node);
}

const ArrayNode& as_array(const Node& node) {
    return static_cast<const ArrayNode&>(node);
}

DenseArray read_array_elem(const IORegistry& reg, const Node& node) {
    Element e = reg.read_elem(node);
    if (const auto* a = e.get_if<DenseArray>()) return *a;
    throw TypeMismatchError("'" + node.path() + "' holds " + e.type_name() + ", expected an array");
}

std::vector<Index> to_indices(const DenseArray& a) {
    std::vector<Index> out(a.size());
    for (Size i = 0; i < out.size(); ++i) out[i] = a.as_index(i);
    return out;
}

/// Options for 0-d datasets: never chunked or resizable; compression only
/// where the backend accepts it.
WriteOptions scalar_options(const GroupNode& parent, const WriteOptions& options) {
    WriteOptions o = options;
    o.chunks.clear();
    o.resizable = false;
    if (!parent.capabilities().compressed_scalars) o = o.without_compression();
    return o;
}

AxisSelector row_selector(const Indices& indices) {
    return indices.empty() ? AxisSelector{Slice::all()} : indices.front();
}

// =============================================================================
// Mapping
// =============================================================================

void write_mapping(const IORegistry& reg, GroupNode& parent, const std::string& key,
                   const Element& value, const WriteOptions& options)
{
    const auto& m = value.as<Mapping>();
    auto g = parent.create_group(key);
    for (Size i = 0; i < m.size(); ++i) {
        reg.write_elem(*g, m.keys()[i], m.value(i), options);
    }
}

Element read_mapping(const IORegistry& reg, const Node& node) {
    const auto& g = as_group(node);
    Mapping out;
    for (const auto& name : g.child_names()) {
        out.insert(name, reg.read_elem(*g.open(name)));
    }
    return out;
}

Element read_mapping_partial(const IORegistry& reg, const Node& node,
                             const ItemFilter& items, const Indices& indices)
{
    const auto& g = as_group(node);
    Mapping out;
    for (const auto& name : g.child_names()) {
        if (!items.contains(name)) continue;
        out.insert(name, reg.read_elem_partial(*g.open(name), items.nested(name), indices));
    }
    return out;
}

// =============================================================================
// Dense Arrays
// =============================================================================

void write_array(const IORegistry&, GroupNode& parent, const std::string& key,
                 const Element& value, const WriteOptions& options)
{
    parent.create_array(key, value.as<DenseArray>(), options);
}

// The backend picks the native variable-length form (HDF5 vlen UTF-8,
// Zarr object array with the vlen-utf8 codec).
void write_string_array(const IORegistry&, GroupNode& parent, const std::string& key,
                        const Element& value, const WriteOptions& options)
{
    const auto& a = value.as<DenseArray>();
    parent.create_array(key, a.dtype() == DType::String ? a : a.astype(DType::String), options);
}

Element read_array(const IORegistry&, const Node& node) {
    return as_array(node).read();
}

Element read_array_partial(const IORegistry&, const Node& node, const ItemFilter&,
                           const Indices& indices)
{
    return as_array(node).read(indices);
}

// =============================================================================
// Record Arrays
// =============================================================================

void write_recarray(const IORegistry&, GroupNode& parent, const std::string& key,
                    const Element& value, const WriteOptions& options)
{
    parent.create_records(key, value.as<RecordArray>(), options);
}

Element read_recarray(const IORegistry&, const Node& node) {
    return as_array(node).read_records();
}

// =============================================================================
// Sparse Matrices
// =============================================================================

SparseFormat sparse_format_of(const GroupNode& g) {
    const Tag tag = read_tag(g);
    const std::string fmt = tag.is_legacy() ? g.get_string_attr(config::kLegacySparseAttr)
                                            : tag.name;
    if (fmt == "csr" || fmt == "csr_matrix") return SparseFormat::Csr;
    if (fmt == "csc" || fmt == "csc_matrix") return SparseFormat::Csc;
    throw ReadError("'" + g.path() + "' has unknown sparse format '" + fmt + "'");
}

std::array<Size, 2> sparse_shape_of(const GroupNode& g) {
    const char* attr = g.has_attr(config::kLegacySparseShapeAttr) ? config::kLegacySparseShapeAttr
                                                                   : config::kShapeAttr;
    const auto shape = g.get_ints_attr(attr);
    if (shape.size() != 2 || shape[0] < 0 || shape[1] < 0) {
        throw ReadError("'" + g.path() + "' has an invalid sparse shape");
    }
    return {static_cast<Size>(shape[0]), static_cast<Size>(shape[1])};
}

void write_sparse(const IORegistry&, GroupNode& parent, const std::string& key,
                  const Element& value, const WriteOptions& options)
{
    const auto& m = value.as<SparseMatrix>();
    auto g = parent.create_group(key);
    g->set_attr(config::kShapeAttr, AttrValue{std::vector<std::int64_t>{
        static_cast<std::int64_t>(m.rows()), static_cast<std::int64_t>(m.cols())}});

    // component arrays stay appendable
    const WriteOptions grow = options.with_resizable();
    g->create_array("data", m.data(), grow);
    g->create_array("indices", m.indices(), grow);
    g->create_array("indptr", m.indptr(), grow);
}

Element read_sparse(const IORegistry&, const Node& node) {
    const auto& g = as_group(node);
    const auto [rows, cols] = sparse_shape_of(g);
    return SparseMatrix(sparse_format_of(g), rows, cols,
                        g.open_array("data")->read(),
                        g.open_array("indices")->read(),
                        g.open_array("indptr")->read());
}

/// Reads indptr in full, then only the stored entries of the selected major
/// slices; the minor selection is applied to that in-memory block.
Element read_sparse_partial(const IORegistry&, const Node& node, const ItemFilter&,
                            const Indices& indices)
{
    const auto& g = as_group(node);
    const SparseFormat format = sparse_format_of(g);
    const auto [rows, cols] = sparse_shape_of(g);
    const bool csr = format == SparseFormat::Csr;

    const auto sel = resolve_indices(indices, {rows, cols});
    const AxisSelection& major = csr ? sel[0] : sel[1];
    const AxisSelection& minor = csr ? sel[1] : sel[0];
    const Size major_extent = csr ? rows : cols;

    auto data_node = g.open_array("data");
    auto indices_node = g.open_array("indices");
    const DenseArray indptr = g.open_array("indptr")->read();
    const auto ptr = to_indices(indptr);
    if (ptr.size() != major_extent + 1) {
        throw ReadError("'" + g.path() + "' indptr does not match its shape");
    }

    SparseMatrix block;
    if (major.covers(major_extent)) {
        block = SparseMatrix(format, rows, cols, data_node->read(), indices_node->read(), indptr);
    } else {
        Indices entries;
        std::vector<Index> new_ptr{0};
        new_ptr.reserve(major.size() + 1);
        if (major.is_range && major.step == 1) {
            const Index lo = ptr[major.start];
            const Index hi = ptr[major.start + major.count];
            for (Size i = 0; i < major.count; ++i) new_ptr.push_back(ptr[major.start + i + 1] - lo);
            entries = {Slice::range(lo, hi)};
        } else {
            std::vector<Index> positions;
            for (Size i = 0; i < major.size(); ++i) {
                const Size m = major[i];
                for (Index k = ptr[m]; k < ptr[m + 1]; ++k) positions.push_back(k);
                new_ptr.push_back(static_cast<Index>(positions.size()));
            }
            entries = {std::move(positions)};
        }
        block = SparseMatrix(format,
                             csr ? major.size() : rows,
                             csr ? cols : major.size(),
                             data_node->read(entries),
                             indices_node->read(entries),
                             DenseArray::from(new_ptr).astype(indptr.dtype()));
    }

    if (!minor.covers(csr ? cols : rows)) block = block.take_minor(minor);
    return block;
}

// =============================================================================
// DataFrames
// =============================================================================

void write_dataframe(const IORegistry& reg, GroupNode& parent, const std::string& key,
                     const Element& value, const WriteOptions& options)
{
    const auto& df = value.as<DataFrame>();
    for (const auto& name : df.column_names()) {
        if (name == config::kReservedIndexName) throw ReservedColumnNameError(name);
    }

    auto g = parent.create_group(key);
    g->set_attr(config::kColumnOrderAttr, AttrValue{df.column_names()});
    const std::string index_name = df.index_name().value_or(config::kReservedIndexName);
    g->set_attr(config::kIndexAttr, index_name);

    reg.write_elem(*g, index_name, df.index(), options);
    for (Size i = 0; i < df.num_columns(); ++i) {
        reg.write_elem(*g, df.column_names()[i], df.column(i), options);
    }
}

std::string index_key_of(const GroupNode& g) {
    std::string key = g.get_string_attr(config::kIndexAttr);
    if (key.empty()) {
        throw ReadError("dataframe '" + g.path() + "' has no " + config::kIndexAttr + " attribute");
    }
    return key;
}

std::optional<std::string> index_name_of(const std::string& key) {
    if (key == config::kReservedIndexName) return std::nullopt;
    return key;
}

Element read_dataframe(const IORegistry& reg, const Node& node) {
    const auto& g = as_group(node);
    const auto columns = g.get_strings_attr(config::kColumnOrderAttr);
    const std::string idx_key = index_key_of(g);

    DataFrame df(read_array_elem(reg, *g.open(idx_key)), index_name_of(idx_key));
    for (const auto& c : columns) df.add_column(c, reg.read_elem(*g.open(c)));
    return df;
}

Element read_dataframe_partial(const IORegistry& reg, const Node& node,
                               const ItemFilter& items, const Indices& indices)
{
    const auto& g = as_group(node);
    const std::string idx_key = index_key_of(g);
    const Indices rows{row_selector(indices)};

    Element index = reg.read_elem_partial(*g.open(idx_key), ItemFilter{}, rows);
    const auto* index_array = index.get_if<DenseArray>();
    if (!index_array) {
        throw TypeMismatchError("dataframe index of '" + g.path() + "' is " + index.type_name());
    }

    DataFrame df(*index_array, index_name_of(idx_key));
    for (const auto& c : g.get_strings_attr(config::kColumnOrderAttr)) {
        if (!items.contains(c)) continue;
        df.add_column(c, reg.read_elem_partial(*g.open(c), ItemFilter{}, rows));
    }
    return df;
}

// Old-style categorical: a `categories` attribute on the codes array naming
// (or referencing) the categories array, which may carry `ordered`.
Element read_series(const IORegistry& reg, const GroupNode& parent, const Node& column) {
    if (!column.has_attr(config::kLegacyCategoriesAttr)) return reg.read_elem(column);

    const std::string target = column.get_string_attr(config::kLegacyCategoriesAttr);
    const auto categories_node = parent.open(target);
    DenseArray categories = read_array_elem(reg, *categories_node);
    const bool ordered = categories_node->get_bool_attr(config::kLegacyOrderedAttr, false);
    return Categorical(read_array_elem(reg, column), std::move(categories), ordered);
}

Element read_dataframe_legacy(const IORegistry& reg, const Node& node) {
    const auto& g = as_group(node);
    const auto columns = g.get_strings_attr(config::kColumnOrderAttr);
    const std::string idx_key = index_key_of(g);

    Element index = read_series(reg, g, *g.open(idx_key));
    const auto* index_array = index.get_if<DenseArray>();
    if (!index_array) {
        throw TypeMismatchError("dataframe index of '" + g.path() + "' is " + index.type_name());
    }
    DataFrame df(*index_array, index_name_of(idx_key));
    for (const auto& c : columns) df.add_column(c, read_series(reg, g, *g.open(c)));
    return df;
}

// Whole-table read, then column subset, then rows. Only the first axis of
// `indices` is applied.
Element read_dataframe_legacy_partial(const IORegistry& reg, const Node& node,
                                      const ItemFilter& items, const Indices& indices)
{
    DataFrame df = read_dataframe_legacy(reg, node).as<DataFrame>();
    if (!items.is_all()) df = df.select_columns(items.keys());
    return df.take_rows(row_selector(indices));
}

// =============================================================================
// Categorical
// =============================================================================

void write_categorical(const IORegistry& reg, GroupNode& parent, const std::string& key,
                       const Element& value, const WriteOptions& options)
{
    const auto& c = value.as<Categorical>();
    auto g = parent.create_group(key);
    g->set_attr(config::kOrderedAttr, c.ordered());
    reg.write_elem(*g, "codes", c.codes(), options);
    reg.write_elem(*g, "categories", c.categories(), options);
}

Element read_categorical(const IORegistry& reg, const Node& node) {
    const auto& g = as_group(node);
    return Categorical(read_array_elem(reg, *g.open("codes")),
                       read_array_elem(reg, *g.open("categories")),
                       g.get_bool_attr(config::kOrderedAttr));
}

Element read_categorical_partial(const IORegistry& reg, const Node& node, const ItemFilter&,
                                 const Indices& indices)
{
    const auto& g = as_group(node);
    Element codes = reg.read_elem_partial(*g.open("codes"), ItemFilter{}, indices);
    if (!codes.is<DenseArray>()) {
        throw TypeMismatchError("categorical codes of '" + g.path() + "' are " + codes.type_name());
    }
    // categories are shared reference data and always read whole
    return Categorical(codes.as<DenseArray>(),
                       read_array_elem(reg, *g.open("categories")),
                       g.get_bool_attr(config::kOrderedAttr));
}

// =============================================================================
// Nullable Arrays
// =============================================================================

void write_nullable(const IORegistry& reg, GroupNode& parent, const std::string& key,
                    const Element& value, const WriteOptions& options)
{
    const auto& n = value.as<NullableArray>();
    auto g = parent.create_group(key);
    if (n.mask()) reg.write_elem(*g, "mask", *n.mask(), options);
    reg.write_elem(*g, "values", n.values(), options);
}

/// Whole read when `indices` is null; values and mask are sliced alike otherwise.
Element read_nullable(const IORegistry& reg, const GroupNode& g, NullableKind expected,
                      const Indices* indices)
{
    auto read_part = [&](const std::string& key) {
        if (!indices) return read_array_elem(reg, *g.open(key));
        Element e = reg.read_elem_partial(*g.open(key), ItemFilter{}, *indices);
        if (const auto* a = e.get_if<DenseArray>()) return *a;
        throw TypeMismatchError("'" + g.path() + "/" + key + "' holds " + e.type_name());
    };

    std::optional<DenseArray> mask;
    if (g.has_child("mask")) mask = read_part("mask");
    NullableArray out(read_part("values"), std::move(mask));
    if (out.kind() != expected) {
        throw TypeMismatchError("values of nullable array '" + g.path() + "' have the wrong dtype");
    }
    return out;
}

Element read_nullable_integer(const IORegistry& reg, const Node& node) {
    return read_nullable(reg, as_group(node), NullableKind::Integer, nullptr);
}

Element read_nullable_boolean(const IORegistry& reg, const Node& node) {
    return read_nullable(reg, as_group(node), NullableKind::Boolean, nullptr);
}

Element read_nullable_integer_partial(const IORegistry& reg, const Node& node, const ItemFilter&,
                                      const Indices& indices)
{
    return read_nullable(reg, as_group(node), NullableKind::Integer, &indices);
}

Element read_nullable_boolean_partial(const IORegistry& reg, const Node& node, const ItemFilter&,
                                      const Indices& indices)
{
    return read_nullable(reg, as_group(node), NullableKind::Boolean, &indices);
}

// =============================================================================
// Scalars
// =============================================================================

void write_numeric_scalar(const IORegistry&, GroupNode& parent, const std::string& key,
                          const Element& value, const WriteOptions& options)
{
    parent.create_array(key, value.as<Scalar>().value(), scalar_options(parent, options));
}

Element read_numeric_scalar(const IORegistry&, const Node& node) {
    return Scalar(as_array(node).read());
}

void write_string(const IORegistry&, GroupNode& parent, const std::string& key,
                  const Element& value, const WriteOptions& options)
{
    const DenseArray text = DenseArray::strings({value.as<std::string>()}).reshape({});
    parent.create_array(key, text, scalar_options(parent, options).without_compression());
}

Element read_string(const IORegistry&, const Node& node) {
    const DenseArray a = as_array(node).read();
    if (!is_text(a.dtype()) || a.size() != 1) {
        throw TypeMismatchError("'" + node.path() + "' does not hold a single string");
    }
    return a.strings().front();
}

Element read_bytes(const IORegistry&, const Node& node) {
    const DenseArray a = as_array(node).read();
    if (is_text(a.dtype()) && a.size() == 1) return Bytes{a.strings().front()};
    if ((a.dtype() == DType::UInt8 || a.dtype() == DType::Int8) && a.rank() <= 1) {
        return Bytes{std::string(reinterpret_cast<const char*>(a.raw()), a.size())};
    }
    throw TypeMismatchError("'" + node.path() + "' does not hold a byte string");
}

// =============================================================================
// Legacy (untagged) Data
// =============================================================================

void warn_untagged(const Node& node) {
    warn(WarningCategory::OldFormat,
         "Element '" + node.path() + "' was written without encoding metadata.");
}

Element read_legacy_group(const IORegistry& reg, const Node& node) {
    warn_untagged(node);
    if (node.has_attr(config::kLegacySparseAttr)) return read_sparse(reg, node);
    return read_mapping(reg, node);
}

Element read_legacy_array(const IORegistry&, const Node& node) {
    warn_untagged(node);
    const auto& a = as_array(node);
    if (a.is_records()) return a.read_records();

    DenseArray value = a.read();
    if (!value.is_scalar()) return value;
    if (is_text(value.dtype())) return value.strings().front();
    return Scalar(std::move(value));
}

// =============================================================================
// AnnData / Raw
// =============================================================================

void write_anndata(const IORegistry& reg, GroupNode& parent, const std::string& key,
                   const Element& value, const WriteOptions& options)
{
    const auto& a = value.as<AnnData>();
    auto g = parent.create_group(key);
    if (a.X) reg.write_elem(*g, "X", *a.X, options);
    reg.write_elem(*g, "obs", a.obs, options);
    reg.write_elem(*g, "var", a.var, options);
    reg.write_elem(*g, "obsm", a.obsm, options);
    reg.write_elem(*g, "varm", a.varm, options);
    reg.write_elem(*g, "obsp", a.obsp, options);
    reg.write_elem(*g, "varp", a.varp, options);
    reg.write_elem(*g, "layers", a.layers, options);
    reg.write_elem(*g, "uns", a.uns, options);
    if (a.raw) reg.write_elem(*g, "raw", *a.raw, options);
}

void write_raw(const IORegistry& reg, GroupNode& parent, const std::string& key,
               const Element& value, const WriteOptions& options)
{
    const auto& r = value.as<Raw>();
    auto g = parent.create_group(key);
    if (r.X) reg.write_elem(*g, "X", *r.X, options);
    reg.write_elem(*g, "var", r.var, options);
    reg.write_elem(*g, "varm", r.varm, options);
}

std::optional<DType> matrix_dtype(const Element& X) {
    if (const auto* d = X.get_if<DenseArray>()) return d->dtype();
    if (const auto* s = X.get_if<SparseMatrix>()) return s->dtype();
    return std::nullopt;
}

Element read_anndata(const IORegistry& reg, const Node& node) {
    const auto& g = as_group(node);
    AnnData out;
    Mapping* slots[] = {&out.obsm, &out.varm, &out.obsp, &out.varp, &out.layers, &out.uns};
    const char* slot_names[] = {"obsm", "varm", "obsp", "varp", "layers", "uns"};

    if (g.has_child("X")) {
        out.X = std::make_shared<const Element>(reg.read_elem(*g.open("X")));
        out.dtype = matrix_dtype(*out.X);
    }
    if (g.has_child("obs")) out.obs = reg.read_elem(*g.open("obs")).as<DataFrame>();
    if (g.has_child("var")) out.var = reg.read_elem(*g.open("var")).as<DataFrame>();
    for (Size i = 0; i < std::size(slots); ++i) {
        if (g.has_child(slot_names[i])) {
            *slots[i] = reg.read_elem(*g.open(slot_names[i])).as<Mapping>();
        }
    }
    if (g.has_child("raw")) {
        out.raw = std::make_shared<const Raw>(reg.read_elem(*g.open("raw")).as<Raw>());
    }
    return out;
}

Element read_raw(const IORegistry& reg, const Node& node) {
    const auto& g = as_group(node);
    Raw out;
    if (g.has_child("X")) out.X = std::make_shared<const Element>(reg.read_elem(*g.open("X")));
    if (g.has_child("var")) out.var = reg.read_elem(*g.open("var")).as<DataFrame>();
    if (g.has_child("varm")) out.varm = reg.read_elem(*g.open("varm")).as<Mapping>();
    return out;
}

} // namespace

// =============================================================================
// Registration
// =============================================================================

void register_default_methods(IORegistry& r) {
    using T = ElementType;
    using K = ElementKind;
    constexpr auto kGroup = NodeKind::Group;
    constexpr auto kArrayNode = NodeKind::Array;

    for (const BackendKind b : {BackendKind::Hdf5, BackendKind::Zarr}) {
        // writers
        r.register_write(b, T::Mapping, std::nullopt, kDict, write_mapping);
        r.register_write(b, T::DenseArray, std::nullopt, kArray, write_array);
        r.register_write(b, T::DenseArray, K::Text, kStringArray, write_string_array);
        r.register_write(b, T::DenseArray, K::Object, kStringArray, write_string_array);
        r.register_write(b, T::RecordArray, std::nullopt, kRecArray, write_recarray);
        r.register_write(b, T::CsrMatrix, std::nullopt, kCsrMatrix, write_sparse);
        r.register_write(b, T::CscMatrix, std::nullopt, kCscMatrix, write_sparse);
        r.register_write(b, T::DataFrame, std::nullopt, kDataFrame, write_dataframe);
        r.register_write(b, T::Categorical, std::nullopt, kCategorical, write_categorical);
        r.register_write(b, T::NullableInteger, std::nullopt, kNullableInteger, write_nullable);
        r.register_write(b, T::NullableBoolean, std::nullopt, kNullableBoolean, write_nullable);
        r.register_write(b, T::Scalar, std::nullopt, kNumericScalar, write_numeric_scalar);
        r.register_write(b, T::String, std::nullopt, kString, write_string);
        r.register_write(b, T::AnnData, std::nullopt, kAnnData, write_anndata);
        r.register_write(b, T::Raw, std::nullopt, kRaw, write_raw);

        // readers
        r.register_read(b, kGroup, kLegacy, read_legacy_group);
        r.register_read(b, kArrayNode, kLegacy, read_legacy_array);
        r.register_read(b, kGroup, kDict, read_mapping);
        r.register_read(b, kArrayNode, kArray, read_array);
        r.register_read(b, kArrayNode, kStringArray, read_array);
        r.register_read(b, kArrayNode, kRecArray, read_recarray);
        r.register_read(b, kGroup, kCsrMatrix, read_sparse);
        r.register_read(b, kGroup, kCscMatrix, read_sparse);
        r.register_read(b, kGroup, kDataFrame, read_dataframe);
        r.register_read(b, kGroup, kDataFrameLegacy, read_dataframe_legacy);
        r.register_read(b, kGroup, kCategorical, read_categorical);
        r.register_read(b, kGroup, kNullableInteger, read_nullable_integer);
        r.register_read(b, kGroup, kNullableBoolean, read_nullable_boolean);
        r.register_read(b, kArrayNode, kNumericScalar, read_numeric_scalar);
        r.register_read(b, kArrayNode, kString, read_string);
        r.register_read(b, kArrayNode, kBytes, read_bytes);
        r.register_read(b, kGroup, kAnnData, read_anndata);
        r.register_read(b, kGroup, kRaw, read_raw);

        // partial readers
        r.register_read_partial(b, kGroup, kDict, read_mapping_partial);
        r.register_read_partial(b, kArrayNode, kArray, read_array_partial);
        r.register_read_partial(b, kArrayNode, kStringArray, read_array_partial);
        r.register_read_partial(b, kGroup, kCsrMatrix, read_sparse_partial);
        r.register_read_partial(b, kGroup, kCscMatrix, read_sparse_partial);
        r.register_read_partial(b, kGroup, kDataFrame, read_dataframe_partial);
        r.register_read_partial(b, kGroup, kDataFrameLegacy, read_dataframe_legacy_partial);
        r.register_read_partial(b, kGroup, kCategorical, read_categorical_partial);
        r.register_read_partial(b, kGroup, kNullableInteger, read_nullable_integer_partial);
        r.register_read_partial(b, kGroup, kNullableBoolean, read_nullable_boolean_partial);
    }
}

} // namespace celio::spec
