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
#include <string>
#include <string_view>
#include <vector>

#include <cstdio>

#include "commandline/commandline.hxx"

#include "vfs/collision.hxx"

namespace action
{
struct context final
{
    // the buffer file
    std::filesystem::path record;
    std::filesystem::path cwd;
    // asked when a paste destination exists
    vfs::collision_resolver::query_t query;
    bool color{false};
    std::FILE* out{stdout};
};

void add(const context& ctx, const std::vector<std::string>& args, bool fresh);
void paste(const context& ctx, const std::vector<std::string>& args, bool clear);
void del(const context& ctx, const std::vector<std::string>& args);
void list(const context& ctx, const std::vector<std::string>& args);
void clear(const context& ctx, const std::vector<std::string>& args);
void help(const context& ctx, const std::vector<std::string>& args);

/**
 * Run the handler for command.
 *
 * @throws std::system_error with a vfs::error_code, or
 *         std::filesystem::filesystem_error from the transfer
 */
void run(commandline::command command, const context& ctx, const std::vector<std::string>& args);

namespace detail
{
// vfs::error_code::argument_error if args is not empty
void check_no_args(const std::vector<std::string>& args);
// the name add prints for a path, the root has no filename
[[nodiscard]] std::string display_name(const std::filesystem::path& path) noexcept;
} // namespace detail
} // namespace action
