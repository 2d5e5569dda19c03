// SPDX-License-Identifier: Apache-2.0
#include "FileReader.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace toolchat
{

auto FilesystemReader::read(std::string_view path) -> Result<std::string>
{
    auto const filePath = std::filesystem::path(path);

    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(filePath, ec))
        return makeError(ErrorCode::IoError, std::format("Not a regular file: {}", path));

    auto const size = std::filesystem::file_size(filePath, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot stat {}: {}", path, ec.message()));
    if (size > _maxBytes)
        return makeError(ErrorCode::IoError,
                         std::format("File {} is too large ({} bytes, limit {})", path, size, _maxBytes));

    auto file = std::ifstream(filePath, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

} // namespace toolchat
