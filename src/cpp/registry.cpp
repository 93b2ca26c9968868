#include "celio/spec/registry.hpp"

#include <algorithm>
#include <utility>

namespace celio::spec {

namespace {

std::string backend_label(BackendKind backend, NodeKind node) {
    return std::string(backend_kind_name(backend)) + " " + node_kind_name(node);
}

} // namespace

// =============================================================================
// ItemFilter
// =============================================================================

ItemFilter::ItemFilter(std::initializer_list<std::string> keys)
    : all_(false)
{
    for (const auto& k : keys) select(k);
}

ItemFilter ItemFilter::none() {
    ItemFilter f;
    f.all_ = false;
    return f;
}

ItemFilter& ItemFilter::select(std::string key) {
    return select(std::move(key), ItemFilter{});
}

ItemFilter& ItemFilter::select(std::string key, ItemFilter nested) {
    all_ = false;
    const auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it != keys_.end()) {
        nested_[static_cast<Size>(it - keys_.begin())] = std::move(nested);
        return *this;
    }
    keys_.push_back(std::move(key));
    nested_.push_back(std::move(nested));
    return *this;
}

bool ItemFilter::contains(const std::string& key) const noexcept {
    return all_ || std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

const ItemFilter& ItemFilter::nested(const std::string& key) const {
    static const ItemFilter kAll;
    const auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) return kAll;
    return nested_[static_cast<Size>(it - keys_.begin())];
}

// =============================================================================
// Registration
// =============================================================================

void IORegistry::register_write(BackendKind backend, ElementType type,
                                std::optional<ElementKind> kind, Tag tag, WriteFn fn)
{
    writers_[WriterKey{backend, type, kind}] = WriterEntry{std::move(tag), std::move(fn)};
}

void IORegistry::register_read(BackendKind backend, NodeKind node, Tag tag, ReadFn fn) {
    readers_[ReaderKey{backend, node, std::move(tag)}] = std::move(fn);
}

void IORegistry::register_read_partial(BackendKind backend, NodeKind node, Tag tag,
                                       ReadPartialFn fn)
{
    partial_readers_[ReaderKey{backend, node, std::move(tag)}] = std::move(fn);
}

// =============================================================================
// Lookup
// =============================================================================

bool IORegistry::has_writer(BackendKind backend, const Element& value) const {
    if (const auto kind = value.element_kind()) {
        if (writers_.contains(WriterKey{backend, value.type(), kind})) return true;
    }
    return writers_.contains(WriterKey{backend, value.type(), std::nullopt});
}

bool IORegistry::has_reader(BackendKind backend, NodeKind node, const Tag& tag) const {
    return readers_.contains(ReaderKey{backend, node, tag});
}

bool IORegistry::has_partial_reader(BackendKind backend, NodeKind node, const Tag& tag) const {
    return partial_readers_.contains(ReaderKey{backend, node, tag});
}

const IORegistry::WriterEntry& IORegistry::get_writer(BackendKind backend,
                                                      const Element& value) const
{
    // (type, kind) first, then the bare type
    if (const auto kind = value.element_kind()) {
        if (auto it = writers_.find(WriterKey{backend, value.type(), kind}); it != writers_.end()) {
            return it->second;
        }
    }
    if (auto it = writers_.find(WriterKey{backend, value.type(), std::nullopt}); it != writers_.end()) {
        return it->second;
    }
    throw NoWriterFoundError(value.type_name(), backend_kind_name(backend));
}

const ReadFn& IORegistry::get_reader(BackendKind backend, NodeKind node, const Tag& tag) const {
    if (auto it = readers_.find(ReaderKey{backend, node, tag}); it != readers_.end()) {
        return it->second;
    }
    throw NoReaderFoundError(tag.str(), backend_label(backend, node));
}

const ReadPartialFn& IORegistry::get_partial_reader(BackendKind backend, NodeKind node,
                                                    const Tag& tag) const
{
    if (auto it = partial_readers_.find(ReaderKey{backend, node, tag}); it != partial_readers_.end()) {
        return it->second;
    }
    throw NoPartialReaderFoundError(tag.str(), backend_label(backend, node));
}

// =============================================================================
// Dispatch
// =============================================================================

void IORegistry::write_elem(GroupNode& parent, const std::string& key, const Element& value,
                            const WriteOptions& options) const
{
    try {
        const WriterEntry& entry = get_writer(parent.backend(), value);

        // overwrite is destructive: no residue from a previous value
        parent.delete_child(key);
        entry.write(*this, parent, key, value, options);

        auto node = parent.open(key);
        write_tag(*node, entry.tag);
    } catch (Exception& e) {
        e.push_key(key);
        throw;
    }
}

Element IORegistry::read_elem(const Node& node) const {
    try {
        const Tag tag = read_tag(node);
        const ReadFn& fn = get_reader(node.backend(), node.kind(), tag);
        return fn(*this, node);
    } catch (Exception& e) {
        e.push_key(node.name());
        throw;
    }
}

Element IORegistry::read_elem_partial(const Node& node, const ItemFilter& items,
                                      const Indices& indices) const
{
    try {
        const Tag tag = read_tag(node);
        const ReadPartialFn& fn = get_partial_reader(node.backend(), node.kind(), tag);
        return fn(*this, node, items, indices);
    } catch (Exception& e) {
        e.push_key(node.name());
        throw;
    }
}

// =============================================================================
// Default Registry
// =============================================================================

const IORegistry& default_registry() {
    static const IORegistry registry = [] {
        IORegistry r;
        register_default_methods(r);
        return r;
    }();
    return registry;
}

void write_elem(GroupNode& parent, const std::string& key, const Element& value,
                const WriteOptions& options)
{
    default_registry().write_elem(parent, key, value, options);
}

Element read_elem(const Node& node) {
    return default_registry().read_elem(node);
}

Element read_elem_partial(const Node& node, const ItemFilter& items, const Indices& indices) {
    return default_registry().read_elem_partial(node, items, indices);
}

} // namespace celio::spec
