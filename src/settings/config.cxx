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
#include <string>

#include <cstdio>

#include <unistd.h>

#include <glaze/glaze.hpp>

#include <magic_enum/magic_enum.hpp>

#include "settings/config.hxx"
#include "settings/settings.hxx"

#include "logger.hxx"

namespace config::disk_format
{
struct config_data final
{
    std::string color{magic_enum::enum_name(config::color_mode::tty)};
    std::string buffer;
};
} // namespace config::disk_format

config::settings
config::load(const std::filesystem::path& file) noexcept
{
    config::settings settings;

    if (!std::filesystem::exists(file))
    {
        logger::debug<logger::domain::config>("no config file at {}", file.string());
        return settings;
    }

    disk_format::config_data config_data{};
    std::string buffer;
    const auto ec = glz::read_file_json<glz::opts{.error_on_unknown_keys = false}>(config_data,
                                                                                   file.c_str(),
                                                                                   buffer);
    if (ec)
    {
        logger::warn<logger::domain::config>("Failed to load config file {}: {}",
                                             file.string(),
                                             glz::format_error(ec, buffer));
        return settings;
    }

    const auto color = magic_enum::enum_cast<config::color_mode>(config_data.color);
    if (color)
    {
        settings.color = color.value();
    }
    else
    {
        logger::warn<logger::domain::config>("Invalid color mode '{}' in {}",
                                             config_data.color,
                                             file.string());
    }

    if (!config_data.buffer.empty())
    {
        const std::filesystem::path buffer_path = config_data.buffer;
        if (buffer_path.is_absolute())
        {
            settings.buffer = buffer_path;
        }
        else
        {
            logger::warn<logger::domain::config>("Buffer path must be absolute: {}",
                                                 config_data.buffer);
        }
    }

    logger::debug<logger::domain::config>("loaded {}: color={} buffer={}",
                                          file.string(),
                                          magic_enum::enum_name(settings.color),
                                          settings.buffer.string());

    return settings;
}

bool
config::use_color(config::color_mode mode, std::FILE* stream) noexcept
{
    switch (mode)
    {
        case config::color_mode::always:
            return true;
        case config::color_mode::never:
            return false;
        case config::color_mode::tty:
            return isatty(fileno(stream)) == 1;
    }
    return false;
}
