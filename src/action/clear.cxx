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

#include <print>
#include <string>
#include <system_error>
#include <vector>

#include "action/action.hxx"

#include "vfs/error.hxx"
#include "vfs/selection.hxx"

#include "logger.hxx"

void
action::clear(const context& ctx, const std::vector<std::string>& args)
{
    detail::check_no_args(args);

    vfs::selection sel(ctx.record);

    std::string summary;
    try
    {
        sel.load();
        summary = sel.describe();
    }
    catch (const std::system_error& e)
    {
        if (e.code() != vfs::error_code::corrupt_buffer)
        {
            throw;
        }
        // clear is how a corrupt buffer gets fixed
        logger::warn<logger::domain::selection>("clearing corrupt buffer: {}", e.what());
    }

    sel.clear();

    if (!summary.empty())
    {
        std::println(ctx.out, "cleared {}", summary);
    }
}
