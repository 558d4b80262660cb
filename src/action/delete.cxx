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
#include <vector>

#include "action/action.hxx"

#include "vfs/error.hxx"
#include "vfs/selection.hxx"
#include "vfs/transfer.hxx"

#include "logger.hxx"

void
action::del(const context& ctx, const std::vector<std::string>& args)
{
    detail::check_no_args(args);

    vfs::selection sel(ctx.record);
    sel.load();
    if (sel.empty())
    {
        vfs::raise(vfs::error_code::empty_selection, ctx.record.string());
    }

    vfs::transfer::remove_stats stats;

    // failed entries stay selected
    const auto finish = [&]()
    {
        sel.save();
        std::println(ctx.out, "{}", stats.summary());
        logger::info<logger::domain::transfer>("{}, {} left", stats.summary(), sel.size());
    };

    try
    {
        vfs::transfer::remove(sel, stats);
    }
    catch (...)
    {
        finish();
        throw;
    }
    finish();
}
