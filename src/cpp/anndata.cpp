#include "celio/spec/anndata.hpp"

#include <memory>
#include <unordered_map>

namespace celio::spec {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// obs / var read with no columns: only the index is loaded.
DenseArray read_axis_index(const GroupNode& root, const std::string& key,
                           const IORegistry& registry)
{
    if (!root.has_child(key)) {
        throw ReadError("'" + root.path() + "' has no " + key + " table");
    }
    Element e = registry.read_elem_partial(*root.open(key), ItemFilter::none());
    const auto* df = e.get_if<DataFrame>();
    if (!df) throw TypeMismatchError("'" + key + "' holds " + e.type_name() + ", expected a dataframe");
    return df->index();
}

DataFrame read_table(const GroupNode& root, const std::string& key, const ItemFilter& items,
                     const AxisSelector& rows, const IORegistry& registry)
{
    Element e = registry.read_elem_partial(*root.open(key), items, Indices{rows, Slice::all()});
    return e.as<DataFrame>();
}

/// Partial read of every selected child of a mapping slot; absent slot -> empty.
Mapping read_slot(const GroupNode& root, const std::string& key, const ItemFilter& items,
                  const Indices& indices, const IORegistry& registry)
{
    Mapping out;
    if (!root.has_child(key)) return out;

    const auto group = root.open_group(key);
    for (const auto& name : group->child_names()) {
        if (!items.contains(name)) continue;
        try {
            out.insert(name, registry.read_elem_partial(*group->open(name), items.nested(name), indices));
        } catch (Exception& e) {
            e.push_key(key);
            throw;
        }
    }
    return out;
}

// uns has no axes: selected children without a nested filter are read whole.
Mapping read_uns(const GroupNode& root, const ItemFilter& items, const IORegistry& registry) {
    Mapping out;
    if (!root.has_child("uns")) return out;

    const auto group = root.open_group("uns");
    for (const auto& name : group->child_names()) {
        if (!items.contains(name)) continue;
        const ItemFilter& nested = items.nested(name);
        try {
            auto node = group->open(name);
            out.insert(name, nested.is_all() ? registry.read_elem(*node)
                                             : registry.read_elem_partial(*node, nested));
        } catch (Exception& e) {
            e.push_key("uns");
            throw;
        }
    }
    return out;
}

} // namespace

// =============================================================================
// Index Normalization
// =============================================================================

AxisSelector normalize_index(const IndexSpec& spec, const DenseArray& axis_index) {
    return std::visit(overloaded{
        [](const Slice& s) -> AxisSelector { return s; },
        [](const std::vector<Index>& v) -> AxisSelector { return v; },
        [&](const std::vector<bool>& mask) -> AxisSelector {
            if (mask.size() != axis_index.size()) {
                throw DimensionError("boolean mask of length " + std::to_string(mask.size()) +
                                     " does not match axis of length " +
                                     std::to_string(axis_index.size()));
            }
            std::vector<Index> positions;
            for (Size i = 0; i < mask.size(); ++i) {
                if (mask[i]) positions.push_back(static_cast<Index>(i));
            }
            return positions;
        },
        [&](const std::vector<std::string>& labels) -> AxisSelector {
            if (!is_text(axis_index.dtype())) {
                throw TypeMismatchError("label selection needs a text index, got " +
                                        std::string(dtype_name(axis_index.dtype())));
            }
            const auto& names = axis_index.strings();
            std::unordered_map<std::string, Index> lookup;
            lookup.reserve(names.size());
            for (Size i = 0; i < names.size(); ++i) {
                lookup.emplace(names[i], static_cast<Index>(i));
            }

            std::vector<Index> positions;
            positions.reserve(labels.size());
            for (const auto& label : labels) {
                const auto it = lookup.find(label);
                if (it == lookup.end()) throw ValueError("label '" + label + "' not found in index");
                positions.push_back(it->second);
            }
            return positions;
        },
    }, spec);
}

// =============================================================================
// read_partial
// =============================================================================

AnnData read_partial(const GroupNode& root, const PartialReadOptions& options,
                     const IORegistry& registry)
{
    const DenseArray obs_names = read_axis_index(root, "obs", registry);
    const DenseArray var_names = read_axis_index(root, "var", registry);
    const AxisSelector rows = normalize_index(options.obs_idx, obs_names);
    const AxisSelector cols = normalize_index(options.var_idx, var_names);

    AnnData out;
    out.obs = read_table(root, "obs", options.obs, rows, registry);
    out.var = read_table(root, "var", options.var, cols, registry);

    if (options.X && root.has_child("X")) {
        out.X = std::make_shared<const Element>(
            registry.read_elem_partial(*root.open("X"), ItemFilter{}, Indices{rows, cols}));
        if (const auto* d = out.X->get_if<DenseArray>()) out.dtype = d->dtype();
        if (const auto* s = out.X->get_if<SparseMatrix>()) out.dtype = s->dtype();
    } else {
        // placeholder keeps n_obs x n_vars visible to callers
        out.X = std::make_shared<const Element>(
            SparseMatrix::empty(SparseFormat::Csr, out.obs.num_rows(), out.var.num_rows()));
    }

    out.obsm = read_slot(root, "obsm", options.obsm, {rows, Slice::all()}, registry);
    out.varm = read_slot(root, "varm", options.varm, {cols, Slice::all()}, registry);
    out.obsp = read_slot(root, "obsp", options.obsp, {rows, rows}, registry);
    out.varp = read_slot(root, "varp", options.varp, {cols, cols}, registry);
    out.layers = read_slot(root, "layers", options.layers, {rows, cols}, registry);
    out.uns = read_uns(root, options.uns, registry);
    return out;
}

} // namespace celio::spec
