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
#include <print>
#include <string>
#include <vector>

#include "action/action.hxx"

#include "utils/style.hxx"

#include "vfs/selection.hxx"

#include "vfs/utils/vfs-utils.hxx"

#include "logger.hxx"

void
action::add(const context& ctx, const std::vector<std::string>& args, bool fresh)
{
    vfs::selection sel(ctx.record);
    if (!fresh)
    {
        sel.load();
    }

    if (args.empty())
    {
        const auto cwd = std::filesystem::canonical(ctx.cwd);
        sel.add_dir(cwd);
        std::println(ctx.out, "{}", utils::style::directory(detail::display_name(cwd), ctx.color));
    }

    // nothing is saved if any argument fails
    for (const auto& arg : args)
    {
        const auto resolved = vfs::utils::resolve(arg, ctx.cwd);
        if (resolved.type == vfs::utils::path_type::directory)
        {
            sel.add_dir(resolved.path);
            std::println(ctx.out,
                         "{}",
                         utils::style::directory(detail::display_name(resolved.path), ctx.color));
        }
        else
        {
            sel.add_file(resolved.path);
            std::println(ctx.out, "{}", detail::display_name(resolved.path));
        }
    }

    sel.save();

    logger::info<logger::domain::selection>("{} {} paths, buffer has {}",
                                            fresh ? "replaced with" : "added",
                                            args.empty() ? std::size_t{1} : args.size(),
                                            sel.describe());

    std::println(ctx.out, "{}", sel.describe());
}
