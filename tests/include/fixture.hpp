#pragma once

// =============================================================================
// celio - Storage Fixtures
// =============================================================================
//
// Per-test scratch stores on both backends, plus warning capture.
//
//   for (auto kind : celio::test::all_backends()) {
//       celio::test::Store store(kind);
//       auto root = store.root();
//       ...
//       auto back = store.reopen();     // fresh handle, re-read from disk
//   }
//
// =============================================================================

#include "celio/core/warning.hpp"
#include "celio/io/h5_storage.hpp"
#include "celio/io/zarr_storage.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace celio::test {

// =============================================================================
// Temporary Directory
// =============================================================================

/// Unique directory under the system temp path, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("celio-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// =============================================================================
// Store Fixture
// =============================================================================

inline std::vector<BackendKind> all_backends() {
    return {BackendKind::Hdf5, BackendKind::Zarr};
}

class Store {
public:
    explicit Store(BackendKind kind) : kind_(kind) {
        if (kind_ == BackendKind::Hdf5) {
            h5_.emplace(H5Store::create(file_path()));
        } else {
            zarr_.emplace(ZarrStore::create(file_path()));
        }
    }

    [[nodiscard]] BackendKind kind() const noexcept { return kind_; }
    [[nodiscard]] const char* label() const noexcept { return backend_kind_name(kind_); }

    [[nodiscard]] std::unique_ptr<GroupNode> root() const {
        return h5_ ? h5_->root() : zarr_->root();
    }

    /// Root of the same store opened again from disk.
    [[nodiscard]] std::unique_ptr<GroupNode> reopen() {
        if (h5_) {
            h5_->flush();
            h5_.emplace(H5Store::open(file_path(), true));
            return h5_->root();
        }
        zarr_.emplace(ZarrStore::open(file_path()));
        return zarr_->root();
    }

    [[nodiscard]] std::filesystem::path file_path() const {
        return dir_.path() / (kind_ == BackendKind::Hdf5 ? "store.h5" : "store.zarr");
    }

private:
    TempDir dir_;
    BackendKind kind_;
    std::optional<H5Store> h5_;
    std::optional<ZarrStore> zarr_;
};

// =============================================================================
// Warning Capture
// =============================================================================

/// Collects every warning emitted while in scope instead of printing it.
class WarningCapture {
public:
    WarningCapture()
        : scope_([this](WarningCategory category, const std::string& message) {
              records_.emplace_back(category, message);
          }) {}

    [[nodiscard]] Size size() const noexcept { return records_.size(); }

    [[nodiscard]] Size count(WarningCategory category) const {
        Size n = 0;
        for (const auto& r : records_) {
            if (r.first == category) ++n;
        }
        return n;
    }

    [[nodiscard]] const std::string& message(Size i) const { return records_.at(i).second; }

private:
    std::vector<std::pair<WarningCategory, std::string>> records_;
    ScopedWarningHandler scope_;
};

} // namespace celio::test
