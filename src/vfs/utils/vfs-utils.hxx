/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <cstdint>

namespace vfs::utils
{
// IEC units, one decimal place
[[nodiscard]] std::string format_file_size(std::uint64_t size_in_bytes) noexcept;

[[nodiscard]] std::string
format_file_time(const std::chrono::system_clock::time_point time) noexcept;

enum class path_type : std::uint8_t
{
    file,
    directory,
};

struct resolve_data final
{
    std::filesystem::path path;
    path_type type;
};
/**
 * @brief resolve
 *
 * - Canonicalize a user supplied path, symlinks are resolved and relative
 *   paths are taken relative to cwd. The result is classified as a regular
 *   file or a directory.
 *
 * @param[in] path The user supplied path
 * @param[in] cwd The directory relative paths are resolved against
 *
 * @return The canonical path and its type
 *
 * @throws std::system_error vfs::error_code::not_found if the path does not exist,
 *         vfs::error_code::unsupported_type if it is neither a file nor a directory
 */
[[nodiscard]] resolve_data resolve(const std::filesystem::path& path,
                                   const std::filesystem::path& cwd);
} // namespace vfs::utils
