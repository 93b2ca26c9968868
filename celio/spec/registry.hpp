#pragma once

#include "celio/core/element.hpp"
#include "celio/io/storage.hpp"
#include "celio/spec/tag.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: celio/spec/registry.hpp
// BRIEF: Encoding registry and the read_elem / write_elem dispatch entry points
//
// DESIGN NOTES:
// - Writers are keyed by (backend, element type, optional element kind);
//   an exact (type, kind) entry wins over the bare-type entry
// - Readers and partial readers are keyed by (backend, node kind, tag) and
//   matched exactly; ("", "") is registered explicitly as the legacy handler
// - The default registry is filled once by register_default_methods() and
//   is read-only afterwards, so concurrent dispatch needs no locking
// =============================================================================

namespace celio::spec {

class IORegistry;

/* =============================================================================
 * CLASS: ItemFilter
 * =============================================================================
 * SUMMARY:
 *     Child-key filter for partial reads.
 *
 * DESIGN PURPOSE:
 *     A default-constructed filter selects every key. A restricted filter
 *     selects only the listed keys, each of which may carry a nested filter
 *     forwarded into that child's partial read.
 * -------------------------------------------------------------------------- */
class ItemFilter {
public:
    ItemFilter() = default;
    ItemFilter(std::initializer_list<std::string> keys);

    /// Restricted filter with no keys yet.
    static ItemFilter none();

    /// Add a key (turns an "all" filter into a restricted one).
    ItemFilter& select(std::string key);
    ItemFilter& select(std::string key, ItemFilter nested);

    [[nodiscard]] bool is_all() const noexcept { return all_; }
    [[nodiscard]] bool contains(const std::string& key) const noexcept;

    /// Filter forwarded into `key`; "all" when none was given.
    [[nodiscard]] const ItemFilter& nested(const std::string& key) const;

    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }

private:
    bool all_ = true;
    std::vector<std::string> keys_;
    std::vector<ItemFilter> nested_;
};

// =============================================================================
// Function Signatures
// =============================================================================

/// Writes `value` as child `key` of `parent`. The child is absent on entry.
using WriteFn = std::function<void(const IORegistry& registry, GroupNode& parent,
                                   const std::string& key, const Element& value,
                                   const WriteOptions& options)>;

using ReadFn = std::function<Element(const IORegistry& registry, const Node& node)>;

using ReadPartialFn = std::function<Element(const IORegistry& registry, const Node& node,
                                            const ItemFilter& items, const Indices& indices)>;

// =============================================================================
// IORegistry
// =============================================================================

class IORegistry {
public:
    struct WriterEntry {
        Tag tag;
        WriteFn write;
    };

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    /// Register a writer. `kind` refines array-like types; std::nullopt
    /// registers the bare-type fallback.
    void register_write(BackendKind backend, ElementType type,
                        std::optional<ElementKind> kind, Tag tag, WriteFn fn);

    void register_read(BackendKind backend, NodeKind node, Tag tag, ReadFn fn);

    void register_read_partial(BackendKind backend, NodeKind node, Tag tag, ReadPartialFn fn);

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    [[nodiscard]] bool has_writer(BackendKind backend, const Element& value) const;
    [[nodiscard]] bool has_reader(BackendKind backend, NodeKind node, const Tag& tag) const;
    [[nodiscard]] bool has_partial_reader(BackendKind backend, NodeKind node, const Tag& tag) const;

    /// Most specific writer for a value; NoWriterFoundError otherwise.
    [[nodiscard]] const WriterEntry& get_writer(BackendKind backend, const Element& value) const;

    /// NoReaderFoundError when (backend, node kind, tag) is not registered.
    [[nodiscard]] const ReadFn& get_reader(BackendKind backend, NodeKind node, const Tag& tag) const;

    /// NoPartialReaderFoundError when (backend, node kind, tag) is not registered.
    [[nodiscard]] const ReadPartialFn& get_partial_reader(BackendKind backend, NodeKind node,
                                                          const Tag& tag) const;

    // -------------------------------------------------------------------------
    // Dispatch
    // -------------------------------------------------------------------------

    /// Replace child `key` of `parent` with `value`, then stamp the tag.
    /// Errors propagate unchanged with `key` prepended to their path.
    void write_elem(GroupNode& parent, const std::string& key, const Element& value,
                    const WriteOptions& options = {}) const;

    [[nodiscard]] Element read_elem(const Node& node) const;

    [[nodiscard]] Element read_elem_partial(const Node& node, const ItemFilter& items = {},
                                            const Indices& indices = {}) const;

private:
    struct WriterKey {
        BackendKind backend;
        ElementType type;
        std::optional<ElementKind> kind;

        friend auto operator<=>(const WriterKey&, const WriterKey&) = default;
    };

    struct ReaderKey {
        BackendKind backend;
        NodeKind node;
        Tag tag;

        friend auto operator<=>(const ReaderKey&, const ReaderKey&) = default;
    };

    std::map<WriterKey, WriterEntry> writers_;
    std::map<ReaderKey, ReadFn> readers_;
    std::map<ReaderKey, ReadPartialFn> partial_readers_;
};

// =============================================================================
// Default Registry
// =============================================================================

/// Register every built-in codec on both backends.
void register_default_methods(IORegistry& registry);

/// Process-wide registry, filled on first use.
[[nodiscard]] const IORegistry& default_registry();

// =============================================================================
// Free Entry Points (default registry)
// =============================================================================

void write_elem(GroupNode& parent, const std::string& key, const Element& value,
                const WriteOptions& options = {});

[[nodiscard]] Element read_elem(const Node& node);

[[nodiscard]] Element read_elem_partial(const Node& node, const ItemFilter& items = {},
                                        const Indices& indices = {});

} // namespace celio::spec
