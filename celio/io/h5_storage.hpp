#pragma once

#include "celio/io/hdf5.hpp"
#include "celio/io/storage.hpp"

#include <memory>
#include <string>

// =============================================================================
// FILE: celio/io/h5_storage.hpp
// BRIEF: HDF5 file backend for the storage interface
//
// Layout matches what h5py produces: variable-length UTF-8 strings, bools as
// an int8 FALSE/TRUE enum, record arrays as compound datasets and string
// attributes as scalar variable-length strings.
// =============================================================================

namespace celio {

class H5GroupNode final : public GroupNode {
public:
    H5GroupNode(std::shared_ptr<h5::File> file, h5::Group group);

    using Node::set_attr;

    [[nodiscard]] BackendKind backend() const noexcept override { return BackendKind::Hdf5; }
    [[nodiscard]] std::string path() const override;

    [[nodiscard]] bool has_attr(const std::string& name) const override;
    [[nodiscard]] std::optional<AttrValue> get_attr(const std::string& name) const override;
    void set_attr(const std::string& name, const AttrValue& value) override;
    [[nodiscard]] std::vector<std::string> attr_names() const override;

    [[nodiscard]] StorageCapabilities capabilities() const noexcept override {
        return StorageCapabilities::hdf5();
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
    std::shared_ptr<h5::File> file_;
    h5::Group group_;
};

class H5ArrayNode final : public ArrayNode {
public:
    H5ArrayNode(std::shared_ptr<h5::File> file, h5::Dataset dataset);

    using Node::set_attr;

    [[nodiscard]] BackendKind backend() const noexcept override { return BackendKind::Hdf5; }
    [[nodiscard]] std::string path() const override;

    [[nodiscard]] bool has_attr(const std::string& name) const override;
    [[nodiscard]] std::optional<AttrValue> get_attr(const std::string& name) const override;
    void set_attr(const std::string& name, const AttrValue& value) override;
    [[nodiscard]] std::vector<std::string> attr_names() const override;

    [[nodiscard]] std::vector<Size> shape() const override;
    [[nodiscard]] DType dtype() const override;
    [[nodiscard]] bool is_records() const override;

    [[nodiscard]] DenseArray read() const override;
    [[nodiscard]] DenseArray read(const Indices& indices) const override;
    [[nodiscard]] RecordArray read_records() const override;

private:
    [[nodiscard]] DenseArray read_space(const h5::Dataspace& mem_space,
                                        const h5::Dataspace& file_space,
                                        std::vector<Size> shape) const;

    std::shared_ptr<h5::File> file_;
    h5::Dataset dataset_;
};

/// An open HDF5 file. Nodes handed out keep the file alive.
class H5Store {
public:
    /// Create (truncating) a file.
    static H5Store create(const std::string& path);

    /// Open an existing file; FileNotFoundError when it does not exist.
    static H5Store open(const std::string& path, bool writable = false);

    [[nodiscard]] std::unique_ptr<GroupNode> root() const;

    void flush();

private:
    explicit H5Store(std::shared_ptr<h5::File> file) : file_(std::move(file)) {}

    std::shared_ptr<h5::File> file_;
};

} // namespace celio
