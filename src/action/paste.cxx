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
#include <format>
#include <print>
#include <string>
#include <vector>

#include "action/action.hxx"

#include "vfs/collision.hxx"
#include "vfs/error.hxx"
#include "vfs/selection.hxx"
#include "vfs/transfer.hxx"

#include "vfs/utils/vfs-utils.hxx"

#include "logger.hxx"

static std::filesystem::path
paste_target(const action::context& ctx, const std::vector<std::string>& args)
{
    if (args.size() > 1)
    {
        vfs::raise(vfs::error_code::too_many_arguments,
                   std::format("expected at most one destination, got {}", args.size()));
    }

    if (args.empty())
    {
        return std::filesystem::canonical(ctx.cwd);
    }

    const auto resolved = vfs::utils::resolve(args.front(), ctx.cwd);
    if (resolved.type != vfs::utils::path_type::directory)
    {
        vfs::raise(vfs::error_code::argument_error,
                   std::format("'{}' is not a directory", args.front()));
    }
    return resolved.path;
}

void
action::paste(const context& ctx, const std::vector<std::string>& args, bool clear)
{
    const auto target = paste_target(ctx, args);

    vfs::selection sel(ctx.record);
    sel.load();
    if (sel.empty())
    {
        vfs::raise(vfs::error_code::empty_selection, ctx.record.string());
    }

    vfs::collision_resolver resolver(ctx.query);
    vfs::transfer::copy_stats stats;

    // runs on success and on error, the buffer keeps what was not copied
    const auto finish = [&]()
    {
        if (clear)
        {
            sel.clear();
        }
        else
        {
            sel.save();
        }
        std::println(ctx.out, "{}", stats.summary());
        logger::info<logger::domain::transfer>("paste into {}: {}",
                                               target.string(),
                                               stats.summary());
    };

    try
    {
        vfs::transfer::copy(sel, target, resolver, stats);
    }
    catch (...)
    {
        finish();
        throw;
    }
    finish();
}
