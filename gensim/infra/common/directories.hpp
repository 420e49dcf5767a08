// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace gensim {

//! \brief TemporaryDirectory is a directory which is created on construction and deleted with all its content
//! on destruction of the instance. The full path starts from a given base path plus a unique non-existent
//! random sub-path. Should no base path be given, the OS temporary storage location is used.
class TemporaryDirectory final {
  public:
    //! \throws std::invalid_argument if base_path is not an existing directory
    explicit TemporaryDirectory(const std::filesystem::path& base_path);

    TemporaryDirectory() : TemporaryDirectory(std::filesystem::temp_directory_path()) {}

    // Not copyable nor movable
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    ~TemporaryDirectory();

    const std::filesystem::path& path() const noexcept { return path_; }

    //! \brief Builds a unique non-existent path under base_path
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path);

  private:
    std::filesystem::path path_;
};

}  // namespace gensim
