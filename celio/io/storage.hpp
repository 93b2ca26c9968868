#pragma once

#include "celio/core/column.hpp"
#include "celio/core/dense.hpp"
#include "celio/core/error.hpp"
#include "celio/core/selection.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// =============================================================================
// FILE: celio/io/storage.hpp
// BRIEF: Narrow capability interface over hierarchical group/array storage
//
// Codecs only talk to storage through GroupNode / ArrayNode. The two
// backends (HDF5 file, Zarr directory store) differ in their native string
// and compression encodings, never in how codecs see them.
// =============================================================================

namespace celio {

enum class BackendKind : std::uint8_t {
    Hdf5,
    Zarr,
};

enum class NodeKind : std::uint8_t {
    Group,
    Array,
};

[[nodiscard]] constexpr const char* backend_kind_name(BackendKind b) noexcept {
    return b == BackendKind::Hdf5 ? "hdf5" : "zarr";
}

[[nodiscard]] constexpr const char* node_kind_name(NodeKind k) noexcept {
    return k == NodeKind::Group ? "group" : "array";
}

/// Small metadata value stored in a node's attribute bag.
using AttrValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::vector<std::int64_t>,
    std::vector<double>>;

/* =============================================================================
 * ENUM: Compression
 * =============================================================================
 * Chunk compressors. HDF5 provides Gzip (deflate) only; the Zarr store
 * provides Gzip (zlib codec) and Zstd.
 * -------------------------------------------------------------------------- */
enum class Compression : std::uint8_t {
    None,
    Gzip,
    Zstd,
};

[[nodiscard]] constexpr const char* compression_name(Compression c) noexcept {
    switch (c) {
        case Compression::None: return "none";
        case Compression::Gzip: return "gzip";
        case Compression::Zstd: return "zstd";
    }
    return "unknown";
}

/* =============================================================================
 * STRUCT: WriteOptions
 * =============================================================================
 * SUMMARY:
 *     Dataset creation options, passed unchanged through every recursive
 *     write_elem call.
 *
 * FIELDS:
 *     chunks      - Chunk shape; empty selects a backend heuristic
 *     compression - Chunk compressor
 *     level       - Compressor level; negative selects the default
 *     shuffle     - Byte shuffle filter before compression (HDF5)
 *     resizable   - Every axis may grow after creation
 * -------------------------------------------------------------------------- */
struct WriteOptions {
    std::vector<Size> chunks;
    Compression compression = Compression::None;
    int level = -1;
    bool shuffle = false;
    bool resizable = false;

    static WriteOptions compressed(Compression c, int level = -1) {
        WriteOptions o;
        o.compression = c;
        o.level = level;
        return o;
    }

    [[nodiscard]] bool is_compressed() const noexcept { return compression != Compression::None; }

    [[nodiscard]] WriteOptions with_resizable() const {
        WriteOptions o = *this;
        o.resizable = true;
        return o;
    }

    [[nodiscard]] WriteOptions with_chunks(std::vector<Size> c) const {
        WriteOptions o = *this;
        o.chunks = std::move(c);
        return o;
    }

    /// Copy with compression (and its level / shuffle) removed.
    [[nodiscard]] WriteOptions without_compression() const {
        WriteOptions o = *this;
        o.compression = Compression::None;
        o.level = -1;
        o.shuffle = false;
        return o;
    }
};

/* =============================================================================
 * STRUCT: StorageCapabilities
 * =============================================================================
 * SUMMARY:
 *     Traits of a backend that codecs adapt to.
 *
 * DESIGN PURPOSE:
 *     - compressed_scalars: HDF5 rejects filters on scalar dataspaces, so
 *       scalar writers strip compression when this is false
 *     - native_vlen_strings: text is stored as variable-length strings
 *       rather than through an object codec
 * -------------------------------------------------------------------------- */
struct StorageCapabilities {
    bool compressed_scalars;
    bool native_vlen_strings;
    bool resizable_arrays;
    bool gzip;
    bool zstd;

    static constexpr StorageCapabilities hdf5() noexcept {
        return {false, true, true, true, false};
    }

    static constexpr StorageCapabilities zarr() noexcept {
        return {true, false, true, true, true};
    }

    [[nodiscard]] constexpr bool supports(Compression c) const noexcept {
        switch (c) {
            case Compression::None: return true;
            case Compression::Gzip: return gzip;
            case Compression::Zstd: return zstd;
        }
        return false;
    }
};

class GroupNode;
class ArrayNode;

// =============================================================================
// Node
// =============================================================================

class Node {
public:
    virtual ~Node() = default;

    [[nodiscard]] virtual BackendKind backend() const noexcept = 0;
    [[nodiscard]] virtual NodeKind kind() const noexcept = 0;

    /// Absolute path inside the store; "/" for the root group.
    [[nodiscard]] virtual std::string path() const = 0;

    /// Last path component; "/" for the root group.
    [[nodiscard]] std::string name() const;

    [[nodiscard]] virtual bool has_attr(const std::string& name) const = 0;
    [[nodiscard]] virtual std::optional<AttrValue> get_attr(const std::string& name) const = 0;
    virtual void set_attr(const std::string& name, const AttrValue& value) = 0;
    [[nodiscard]] virtual std::vector<std::string> attr_names() const = 0;

    // -------------------------------------------------------------------------
    // Typed attribute access (conversions between compatible stored forms)
    // -------------------------------------------------------------------------

    void set_attr(const std::string& name, const char* value) {
        set_attr(name, AttrValue{std::string(value)});
    }

    [[nodiscard]] std::string get_string_attr(const std::string& name,
                                              const std::string& dflt = {}) const;
    [[nodiscard]] bool get_bool_attr(const std::string& name, bool dflt = false) const;
    [[nodiscard]] std::vector<std::string> get_strings_attr(const std::string& name) const;
    [[nodiscard]] std::vector<Index> get_ints_attr(const std::string& name) const;

protected:
    Node() = default;
    Node(const Node&) = default;
    Node& operator=(const Node&) = default;
};

// =============================================================================
// GroupNode
// =============================================================================

class GroupNode : public Node {
public:
    [[nodiscard]] NodeKind kind() const noexcept final { return NodeKind::Group; }

    [[nodiscard]] virtual StorageCapabilities capabilities() const noexcept = 0;

    virtual std::unique_ptr<GroupNode> create_group(const std::string& key) = 0;

    virtual std::unique_ptr<ArrayNode> create_array(
        const std::string& key, const DenseArray& data, const WriteOptions& options) = 0;

    virtual std::unique_ptr<ArrayNode> create_records(
        const std::string& key, const RecordArray& data, const WriteOptions& options) = 0;

    /// Remove a child and everything below it. Missing keys are ignored.
    virtual void delete_child(const std::string& key) = 0;

    [[nodiscard]] virtual bool has_child(const std::string& key) const = 0;

    /// Child names in the backend's natural iteration order.
    [[nodiscard]] virtual std::vector<std::string> child_names() const = 0;

    /// Open a child. `key` may be nested ("a/b") or absolute ("/a/b").
    [[nodiscard]] virtual std::unique_ptr<Node> open(const std::string& key) const = 0;

    [[nodiscard]] std::unique_ptr<GroupNode> open_group(const std::string& key) const;
    [[nodiscard]] std::unique_ptr<ArrayNode> open_array(const std::string& key) const;
};

// =============================================================================
// ArrayNode
// =============================================================================

class ArrayNode : public Node {
public:
    [[nodiscard]] NodeKind kind() const noexcept final { return NodeKind::Array; }

    [[nodiscard]] virtual std::vector<Size> shape() const = 0;

    /// Element dtype. Compound (record) arrays raise TypeError.
    [[nodiscard]] virtual DType dtype() const = 0;

    [[nodiscard]] virtual bool is_records() const = 0;

    [[nodiscard]] virtual DenseArray read() const = 0;

    /// Ranged / indexed read. Only the selected region is transferred.
    [[nodiscard]] virtual DenseArray read(const Indices& indices) const = 0;

    [[nodiscard]] virtual RecordArray read_records() const = 0;
};

} // namespace celio
