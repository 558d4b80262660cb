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
#include <string_view>

#include <cstdio>

#include "settings/settings.hxx"

namespace config
{
namespace disk_format
{
constexpr std::string_view filename{"config.json"};
} // namespace disk_format

/**
 * A missing file gives the defaults. Invalid values are logged and
 * replaced by their default.
 */
[[nodiscard]] config::settings load(const std::filesystem::path& file) noexcept;

[[nodiscard]] bool use_color(config::color_mode mode, std::FILE* stream) noexcept;
} // namespace config
