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

#include <exception>
#include <filesystem>
#include <format>
#include <print>

#include <cstdio>
#include <cstdlib>

#include "action/action.hxx"

#include "commandline/commandline.hxx"

#include "prompt/overwrite.hxx"

#include "settings/config.hxx"
#include "settings/settings.hxx"

#include "utils/style.hxx"

#include "vfs/selection.hxx"
#include "vfs/user-dirs.hxx"

#include "logger.hxx"

int
main(int argc, char* argv[])
{
    const auto opts = commandline::run(argc, argv);
    if (!opts)
    {
        std::println(stderr,
                     "{}",
                     utils::style::error(opts.error(),
                                         config::use_color(config::color_mode::tty, stderr)));
        return EXIT_FAILURE;
    }

    if (opts->version)
    {
        std::println("{} {}", PACKAGE_NAME, PACKAGE_VERSION);
        return EXIT_SUCCESS;
    }

    const auto settings =
        config::load(vfs::program::config() / config::disk_format::filename);
    const auto color = opts->color.value_or(settings.color);

    std::filesystem::path record = vfs::program::data() / vfs::selection_disk_format::filename;
    if (!opts->buffer.empty())
    {
        record = opts->buffer;
    }
    else if (!settings.buffer.empty())
    {
        record = settings.buffer;
    }
    logger::debug("buffer {}", record.string());

    const bool prompt_color = config::use_color(color, stdout);

    try
    {
        const action::context ctx{
            .record = record,
            .cwd = std::filesystem::current_path(),
            .query = [prompt_color](const std::filesystem::path& source,
                                    const std::filesystem::path& destination)
            { return prompt::overwrite(source, destination, prompt_color); },
            .color = config::use_color(color, stdout),
            .out = stdout,
        };

        action::run(opts->command, ctx, opts->args);
    }
    catch (const std::exception& e)
    {
        std::fflush(stdout);
        std::println(stderr,
                     "{}",
                     utils::style::error(std::format("{}: {}",
                                                     commandline::name(opts->command),
                                                     e.what()),
                                         config::use_color(color, stderr)));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
