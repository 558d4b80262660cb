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

#include "commandline/commandline.hxx"

#include "utils/style.hxx"

void
action::help(const context& ctx, const std::vector<std::string>& args)
{
    detail::check_no_args(args);

    std::println(ctx.out, "{} {}", PACKAGE_NAME, PACKAGE_VERSION);
    std::println(ctx.out, "Copy files in one place, paste them in another.");
    std::println(ctx.out, "");
    std::println(ctx.out, "Usage: <command> [OPTIONS] [ARGS]...");
    std::println(ctx.out, "       {} <command> [OPTIONS] [ARGS]...", PACKAGE_NAME);
    std::println(ctx.out, "");
    std::println(ctx.out, "{}", utils::style::emphasis("Commands:", ctx.color));
    for (const auto& command : commandline::commands)
    {
        std::println(ctx.out,
                     "  {:<12} {:<10} {}",
                     command.name,
                     command.args,
                     command.description);
    }
    std::println(ctx.out, "");
    std::println(ctx.out, "{}", utils::style::emphasis("Options:", ctx.color));
    std::println(ctx.out, "  --buffer FILE          Use this buffer file");
    std::println(ctx.out, "  --color MODE           tty, always or never");
    std::println(ctx.out, "  -c, --config DIR       Set configuration directory");
    std::println(ctx.out, "  --loglevel DOMAIN=LVL  Set the loglevel");
    std::println(ctx.out, "  --logfile FILE         Also log to FILE");
    std::println(ctx.out, "  -v, --version          Show version information");
    std::println(ctx.out, "  -h, --help             Show this help");
    std::println(ctx.out, "");
    std::println(ctx.out, "When a paste destination exists: [y]es, [n]o, [Y]es to all, [N]o to all");
}
