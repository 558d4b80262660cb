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

#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <system_error>

#include <cerrno>
#include <cstdio>

#include <unistd.h>

#include <ztd/ztd.hxx>

#include "prompt/overwrite.hxx"

#include "utils/raw-terminal.hxx"
#include "utils/style.hxx"

#include "vfs/collision.hxx"
#include "vfs/error.hxx"

#include "vfs/utils/vfs-utils.hxx"

#include "logger.hxx"

static constexpr char key_interrupt = 0x03; // Ctrl-C
static constexpr char key_eof = 0x04;       // Ctrl-D

static std::string
describe_file(const std::filesystem::path& path, const std::filesystem::path& other)
{
    const auto stat = ztd::lstat::create(path);
    if (!stat)
    {
        return "(cannot stat)";
    }

    std::string relation;
    const auto other_stat = ztd::lstat::create(other);
    if (other_stat)
    {
        if (stat->mtime() > other_stat->mtime())
        {
            relation = "newer";
        }
        else if (stat->mtime() < other_stat->mtime())
        {
            relation = "older";
        }

        if (stat->size() != other_stat->size())
        {
            const auto size_rel = stat->size() > other_stat->size() ? "larger" : "smaller";
            relation = relation.empty() ? size_rel : std::format("{} & {}", relation, size_rel);
        }
    }

    return std::format("{}  {} ( {} bytes ){}",
                       vfs::utils::format_file_time(stat->mtime()),
                       vfs::utils::format_file_size(stat->size()),
                       stat->size(),
                       relation.empty() ? "" : std::format("  ( {} )", relation));
}

vfs::collision_resolve
prompt::overwrite(const std::filesystem::path& source, const std::filesystem::path& destination,
                  bool color, int in_fd, std::FILE* out)
{
    std::println(out,
                 "{} already exists",
                 utils::style::emphasis(destination.string(), color));
    std::println(out, "  source:      {}", describe_file(source, destination));
    std::println(out, "  destination: {}", describe_file(destination, source));
    std::print(out, "[y]es, [n]o, [Y]es to all, [N]o to all: ");
    std::fflush(out);

    const utils::raw_terminal terminal(in_fd);
    logger::trace<logger::domain::prompt>("raw mode: {}", terminal.active());

    while (true)
    {
        char key = 0;
        const auto n = read(in_fd, &key, 1);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "read");
        }

        if (n == 0 || key == key_interrupt || key == key_eof)
        {
            std::println(out, "");
            vfs::raise(vfs::error_code::aborted, destination.string());
        }

        const auto action = vfs::collision_resolve_from_key(key);
        if (!action)
        {
            continue;
        }

        std::println(out, "{}", key);
        return action.value();
    }
}

vfs::collision_resolve
prompt::overwrite(const std::filesystem::path& source, const std::filesystem::path& destination,
                  bool color)
{
    return overwrite(source, destination, color, STDIN_FILENO, stdout);
}
