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
#include <system_error>

#include "vfs/error.hxx"

const std::error_category&
vfs::error_category() noexcept
{
    struct category final : std::error_category
    {
        const char*
        name() const noexcept override final
        {
            return "vfs::error_category()";
        }

        std::string
        message(int c) const override final
        {
            switch (static_cast<vfs::error_code>(c))
            {
                case vfs::error_code::none:
                    return "none";
                case vfs::error_code::argument_error:
                    return "invalid arguments";
                case vfs::error_code::not_found:
                    return "no such file or directory";
                case vfs::error_code::unsupported_type:
                    return "not a regular file or directory";
                case vfs::error_code::empty_selection:
                    return "buffer is empty";
                case vfs::error_code::too_many_arguments:
                    return "too many arguments";
                case vfs::error_code::aborted:
                    return "aborted";
                case vfs::error_code::corrupt_buffer:
                    return "corrupt buffer";
                case vfs::error_code::unrecognized_command:
                    return "unrecognized command";
                default:
                    return "unknown error";
            }
        }
    };
    static const category instance{};
    return instance;
}

std::error_code
vfs::make_error_code(vfs::error_code ec) noexcept
{
    return {static_cast<int>(ec), vfs::error_category()};
}

void
vfs::raise(vfs::error_code ec, const std::string_view context)
{
    throw std::system_error(vfs::make_error_code(ec), std::string(context));
}
