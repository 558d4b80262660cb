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

#include <cstdint>

namespace config
{
enum class color_mode : std::uint8_t
{
    tty, // only when the stream is a terminal
    always,
    never,
};

struct settings final
{
    color_mode color{color_mode::tty};
    // empty means the default buffer location
    std::filesystem::path buffer;
};
} // namespace config
