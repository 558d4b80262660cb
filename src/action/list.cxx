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

#include <algorithm>
#include <print>
#include <string>
#include <vector>

#include "action/action.hxx"

#include "utils/style.hxx"

#include "vfs/selection.hxx"

void
action::list(const context& ctx, const std::vector<std::string>& args)
{
    detail::check_no_args(args);

    vfs::selection sel(ctx.record);
    sel.load();

    // plain string order, not path component order
    std::vector<std::string> dirs;
    for (const auto& dir : sel.dirs())
    {
        dirs.push_back(dir.string());
    }
    std::ranges::sort(dirs);

    std::vector<std::string> files;
    for (const auto& file : sel.files())
    {
        files.push_back(file.string());
    }
    std::ranges::sort(files);

    for (const auto& dir : dirs)
    {
        std::println(ctx.out, "{}", utils::style::directory(dir, ctx.color));
    }
    for (const auto& file : files)
    {
        std::println(ctx.out, "{}", file);
    }

    if (!sel.empty())
    {
        std::println(ctx.out, "{}", sel.describe());
    }
}
