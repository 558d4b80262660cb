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

#include <chrono>
#include <filesystem>
#include <format>
#include <string>
#include <system_error>

#include <cstdint>

#include <ztd/ztd.hxx>

#include "vfs/error.hxx"
#include "vfs/utils/vfs-utils.hxx"

#include "logger.hxx"

std::string
vfs::utils::format_file_size(std::uint64_t size_in_bytes) noexcept
{
    return ztd::format_filesize(size_in_bytes, ztd::base::iec, 1);
}

std::string
vfs::utils::format_file_time(const std::chrono::system_clock::time_point time) noexcept
{
    return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::seconds>(time));
}

vfs::utils::resolve_data
vfs::utils::resolve(const std::filesystem::path& path, const std::filesystem::path& cwd)
{
    const auto absolute = path.is_absolute() ? path : cwd / path;

    // follows symlinks, a dangling link is missing
    std::error_code ec;
    const auto status = std::filesystem::status(absolute, ec);
    if (ec || !std::filesystem::exists(status))
    {
        vfs::raise(vfs::error_code::not_found, path.string());
    }

    const auto canonical = std::filesystem::canonical(absolute);
    logger::trace<logger::domain::selection>("resolve({}) -> {}",
                                             path.string(),
                                             canonical.string());

    if (std::filesystem::is_regular_file(status))
    {
        return {canonical, path_type::file};
    }
    if (std::filesystem::is_directory(status))
    {
        return {canonical, path_type::directory};
    }

    vfs::raise(vfs::error_code::unsupported_type, path.string());
}
