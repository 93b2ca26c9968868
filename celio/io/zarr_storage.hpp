#pragma once

#include "celio/io/storage.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

// =============================================================================
// FILE: celio/io/zarr_storage.hpp
// BRIEF: Zarr v2 directory-store backend for the storage interface
//
// DESIGN NOTES:
// - Metadata lives in .zgroup / .zarray / .zattrs JSON documents
// - Chunks are C-ordered files named "i.j..." ("0" for scalars); edge chunks
//   are padded to the full chunk shape
// - Text arrays use dtype "|O" with the vlen-utf8 filter
// - Record arrays use a structured dtype; text fields are fixed-length "<U"
//   (UTF-32) and legacy "|S" byte fields are decoded as UTF-8
// - Missing chunk files read back as the fill value (zero / empty string)
// =============================================================================

namespace celio {

namespace zarr {

/// Parsed .zarray document.
struct ArrayMeta {
    std::vector<Size> shape;
    std::vector<Size> chunks;
    nlohmann::json dtype;           // type string, or [[name, type], ...] for records
    nlohmann::json fill_value;
    Compression compressor = Compression::None;
    int level = -1;
    Size shuffle = 0;               // shuffle filter element size, 0 when absent
    bool vlen_utf8 = false;
    char separator = '.';

    static ArrayMeta load(const std::filesystem::path& dir);
    void store(const std::filesystem::path& dir) const;
};

} // namespace zarr

class ZarrGroupNode final : public GroupNode {
public:
    ZarrGroupNode(std::filesystem::path root, std::string rel);

    using Node::set_attr;

    [[nodiscard]] BackendKind backend() const noexcept override { return BackendKind::Zarr; }
    [[nodiscard]] std::string path() const override;

    [[nodiscard]] bool has_attr(const std::string& name) const override;
    [[nodiscard]] std::optional<AttrValue> get_attr(const std::string& name) const override;
    void set_attr(const std::string& name, const AttrValue& value) override;
    [[nodiscard]] std::vector<std::string> attr_names() const override;

    [[nodiscard]] StorageCapabilities capabilities() const noexcept override {
        return StorageCapabilities::zarr();
    }

    std::unique_ptr<GroupNode> create_group(const std::string& key) override;
    std::unique_ptr<ArrayNode> create_array(
        const std::string& key, const DenseArray& data, const WriteOptions& options) override;
    std::unique_ptr<ArrayNode> create_records(
        const std::string& key, const RecordArray& data, const WriteOptions& options) override;

    void delete_child(const std::string& key) override;
    [[nodiscard]] bool has_child(const std::string& key) const override;
    [[nodiscard]] std::vector<std::string> child_names() const override;
    [[nodiscard]] std::unique_ptr<Node> open(const std::string& key) const override;

private:
    [[nodiscard]] std::filesystem::path dir() const { return root_ / rel_; }

    std::filesystem::path root_;
    std::string rel_;
};

class ZarrArrayNode final : public ArrayNode {
public:
    ZarrArrayNode(std::filesystem::path root, std::string rel);

    using Node::set_attr;

    [[nodiscard]] BackendKind backend() const noexcept override { return BackendKind::Zarr; }
    [[nodiscard]] std::string path() const override;

    [[nodiscard]] bool has_attr(const std::string& name) const override;
    [[nodiscard]] std::optional<AttrValue> get_attr(const std::string& name) const override;
    void set_attr(const std::string& name, const AttrValue& value) override;
    [[nodiscard]] std::vector<std::string> attr_names() const override;

    [[nodiscard]] std::vector<Size> shape() const override { return meta_.shape; }
    [[nodiscard]] DType dtype() const override;
    [[nodiscard]] bool is_records() const override { return meta_.dtype.is_array(); }

    [[nodiscard]] DenseArray read() const override;
    [[nodiscard]] DenseArray read(const Indices& indices) const override;
    [[nodiscard]] RecordArray read_records() const override;

    [[nodiscard]] const zarr::ArrayMeta& meta() const noexcept { return meta_; }

private:
    [[nodiscard]] std::filesystem::path dir() const { return root_ / rel_; }

    std::filesystem::path root_;
    std::string rel_;
    zarr::ArrayMeta meta_;
};

/// A Zarr v2 directory store rooted at a filesystem directory.
class ZarrStore {
public:
    /// Create (replacing any existing directory) a store with an empty root group.
    static ZarrStore create(const std::filesystem::path& dir);

    /// Open an existing store; FileNotFoundError when the root has no .zgroup.
    static ZarrStore open(const std::filesystem::path& dir);

    [[nodiscard]] std::unique_ptr<GroupNode> root() const;

private:
    explicit ZarrStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::filesystem::path dir_;
};

} // namespace celio
