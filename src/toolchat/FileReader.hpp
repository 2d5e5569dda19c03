// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace toolchat
{

/// @brief Reads attached files on behalf of the chat service.
class FileReader
{
  public:
    virtual ~FileReader() = default;

    [[nodiscard]] virtual auto read(std::string_view path) -> Result<std::string> = 0;
};

/// @brief Reads regular files from the local filesystem, up to a size limit.
class FilesystemReader: public FileReader
{
  public:
    static constexpr size_t DefaultMaxBytes = 1024 * 1024;

    explicit FilesystemReader(size_t maxBytes = DefaultMaxBytes): _maxBytes(maxBytes) {}

    [[nodiscard]] auto read(std::string_view path) -> Result<std::string> override;

  private:
    size_t _maxBytes;
};

} // namespace toolchat
