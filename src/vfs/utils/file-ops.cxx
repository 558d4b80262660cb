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

#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <cerrno>

#include <unistd.h>

#include "vfs/utils/file-ops.hxx"

#include "logger.hxx"

// errno from the failed open, fstream does not report it
static std::error_code
open_error() noexcept
{
    if (errno == 0)
    {
        return std::make_error_code(std::errc::io_error);
    }
    return {errno, std::generic_category()};
}

std::expected<std::string, std::error_code>
vfs::utils::read_file(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        return std::unexpected(open_error());
    }

    std::string buffer{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }

    return buffer;
}

std::expected<void, std::error_code>
vfs::utils::write_file(const std::filesystem::path& path, const std::string_view data) noexcept
{
    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec))
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return std::unexpected(ec);
        }
    }

    // pid suffix keeps two racing invocations from sharing a temporary
    const auto tmp = std::filesystem::path(std::format("{}.{}.tmp", path.string(), getpid()));

    {
        errno = 0;
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            return std::unexpected(open_error());
        }

        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            file.close();
            std::filesystem::remove(tmp, ec);
            return std::unexpected(std::make_error_code(std::errc::io_error));
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        logger::error("Failed to replace {}: {}", path.string(), ec.message());

        std::error_code remove_ec;
        std::filesystem::remove(tmp, remove_ec);
        return std::unexpected(ec);
    }

    return {};
}
