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

#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

#include "vfs/user-dirs.hxx"

// XDG base directories are only honored when absolute
static std::filesystem::path
xdg_dir(const char* name, const std::filesystem::path& fallback) noexcept
{
    const char* value = std::getenv(name);
    if (value != nullptr)
    {
        const std::filesystem::path path = value;
        if (path.is_absolute())
        {
            return path;
        }
    }
    return fallback;
}

std::filesystem::path
vfs::user::home() noexcept
{
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0')
    {
        return home;
    }

    const auto* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr)
    {
        return pw->pw_dir;
    }

    return std::filesystem::temp_directory_path();
}

std::filesystem::path
vfs::user::data() noexcept
{
    return xdg_dir("XDG_DATA_HOME", vfs::user::home() / ".local/share");
}

std::filesystem::path
vfs::user::config() noexcept
{
    return xdg_dir("XDG_CONFIG_HOME", vfs::user::home() / ".config");
}

namespace global
{
static std::filesystem::path config_path = vfs::user::config() / PACKAGE_NAME;
static std::filesystem::path data_path = vfs::user::data() / PACKAGE_NAME;
} // namespace global

std::filesystem::path
vfs::program::config() noexcept
{
    return global::config_path;
}

void
vfs::program::config(const std::filesystem::path& path) noexcept
{
    global::config_path = path;
}

std::filesystem::path
vfs::program::data() noexcept
{
    return global::data_path;
}

void
vfs::program::data(const std::filesystem::path& path) noexcept
{
    global::data_path = path;
}
