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
#include <string>
#include <vector>

#include "action/action.hxx"

#include "commandline/commandline.hxx"

#include "vfs/error.hxx"

void
action::detail::check_no_args(const std::vector<std::string>& args)
{
    if (!args.empty())
    {
        vfs::raise(vfs::error_code::argument_error,
                   std::format("unexpected argument '{}'", args.front()));
    }
}

std::string
action::detail::display_name(const std::filesystem::path& path) noexcept
{
    const auto name = path.filename();
    if (name.empty())
    {
        return path.string();
    }
    return name.string();
}

void
action::run(commandline::command command, const context& ctx,
            const std::vector<std::string>& args)
{
    switch (command)
    {
        case commandline::command::add:
            action::add(ctx, args, false);
            break;
        case commandline::command::add_fresh:
            action::add(ctx, args, true);
            break;
        case commandline::command::paste:
            action::paste(ctx, args, false);
            break;
        case commandline::command::paste_clear:
            action::paste(ctx, args, true);
            break;
        case commandline::command::clear:
            action::clear(ctx, args);
            break;
        case commandline::command::help:
            action::help(ctx, args);
            break;
        case commandline::command::list:
            action::list(ctx, args);
            break;
        case commandline::command::del:
            action::del(ctx, args);
            break;
    }
}
