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

#include <filesystem>

#include <cstdio>

#include "vfs/collision.hxx"

namespace prompt
{
/**
 * @brief overwrite
 *
 * - Show source and destination mtime and size, then read a single
 *   key from in_fd, y n Y N. Other keys are ignored. When in_fd is a
 *   terminal it is switched to raw mode for the duration of the read.
 *
 * @param[in] source The file being pasted
 * @param[in] destination The existing file
 * @param[in] color Highlight the question
 * @param[in] in_fd Where the answer is read from
 * @param[in] out Where the question is written to
 *
 * @return The chosen action
 *
 * @throws std::system_error vfs::error_code::aborted on Ctrl-C, Ctrl-D or end of input
 */
[[nodiscard]] vfs::collision_resolve overwrite(const std::filesystem::path& source,
                                               const std::filesystem::path& destination,
                                               bool color, int in_fd, std::FILE* out);

// stdin, stdout
[[nodiscard]] vfs::collision_resolve overwrite(const std::filesystem::path& source,
                                               const std::filesystem::path& destination,
                                               bool color);
} // namespace prompt
