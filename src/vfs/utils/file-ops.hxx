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

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace vfs::utils
{
[[nodiscard]] std::expected<std::string, std::error_code>
read_file(const std::filesystem::path& path) noexcept;

/**
 * @brief write_file
 *
 * - Replace the contents of a file. The data is written to a temporary sibling
 *   which is then renamed over the target, a reader never sees a truncated file.
 *   Missing parent directories are created.
 *
 * @param[in] path The file to write
 * @param[in] data The new file contents
 */
[[nodiscard]] std::expected<void, std::error_code>
write_file(const std::filesystem::path& path, const std::string_view data) noexcept;
} // namespace vfs::utils
