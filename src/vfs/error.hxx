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

#include <string_view>
#include <system_error>
#include <type_traits>

#include <cstdint>

namespace vfs
{
enum class error_code : std::uint8_t
{
    none,
    argument_error,
    not_found,
    unsupported_type,
    empty_selection,
    too_many_arguments,
    aborted,
    corrupt_buffer,
    unrecognized_command,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(vfs::error_code ec) noexcept;

/**
 * Throw a std::system_error carrying a vfs::error_code.
 * what() of the thrown exception is "<context>: <error message>".
 */
[[noreturn]] void raise(vfs::error_code ec, const std::string_view context);
} // namespace vfs

template<> struct std::is_error_code_enum<vfs::error_code> : std::true_type
{
};
