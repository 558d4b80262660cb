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

#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/format.h>

#include "utils/style.hxx"

std::string
utils::style::directory(const std::string_view text, bool color) noexcept
{
    if (!color)
    {
        return std::string(text);
    }
    return fmt::format(fmt::fg(fmt::terminal_color::blue) | fmt::emphasis::bold, "{}", text);
}

std::string
utils::style::error(const std::string_view text, bool color) noexcept
{
    if (!color)
    {
        return std::string(text);
    }
    return fmt::format(fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold, "{}", text);
}

std::string
utils::style::emphasis(const std::string_view text, bool color) noexcept
{
    if (!color)
    {
        return std::string(text);
    }
    return fmt::format(fmt::emphasis::bold, "{}", text);
}
