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
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <magic_enum/magic_enum.hpp>

#include <CLI/CLI.hpp>

#include "commandline/commandline.hxx"

#include "settings/settings.hxx"

#include "vfs/error.hxx"
#include "vfs/user-dirs.hxx"

#include "logger.hxx"

std::optional<commandline::command>
commandline::lookup(const std::string_view name) noexcept
{
    const auto it = std::ranges::find(commands, name, &command_data::name);
    if (it == commands.cend())
    {
        return std::nullopt;
    }
    return it->command;
}

std::string_view
commandline::name(const command command) noexcept
{
    const auto it = std::ranges::find(commands, command, &command_data::command);
    if (it == commands.cend())
    {
        return "";
    }
    return it->name;
}

struct opts_data final
{
    std::vector<std::string> args;

    std::filesystem::path buffer;
    std::string color;

    std::filesystem::path config_dir;

    std::vector<std::string> raw_log_levels;
    std::unordered_map<std::string, std::string> log_levels;
    std::filesystem::path logfile;

    bool help{false};
    bool version{false};
};

static void
run_commandline(const std::shared_ptr<opts_data>& opt) noexcept
{
    if (!opt->config_dir.empty())
    {
        vfs::program::config(opt->config_dir);
    }

    logger::initialize(opt->log_levels, opt->logfile);
}

static void
setup_commandline(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    // help is a command, not a CLI11 exception
    app.set_help_flag();
    app.add_flag("-h,--help", opt->help, "Show help");

    app.add_option("--buffer", opt->buffer, "Use this buffer file")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    if (std::filesystem::is_directory(input))
                    {
                        return std::format("Buffer path must not be a directory: {}",
                                           input.string());
                    }
                    return std::string();
                }
                return std::format("Buffer path must be absolute: {}", input.string());
            });

    app.add_option("--color", opt->color, "Colored output. One of: tty, always, never")
        ->expected(1)
        ->check(
            [](const std::string& value)
            {
                if (magic_enum::enum_cast<config::color_mode>(value))
                {
                    return std::string();
                }
                return std::format("Invalid color mode: {}", value);
            });

    app.add_option("-c,--config", opt->config_dir, "Set configuration directory")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    if (std::filesystem::exists(input) && !std::filesystem::is_directory(input))
                    {
                        return std::format("Config path must be a directory: {}", input.string());
                    }

                    // Validate pass
                    return std::string();
                }
                return std::format("Config path must be absolute: {}", input.string());
            });

    app.add_option("--loglevel", opt->raw_log_levels, "Set the loglevel. Format: domain=level")
        ->check(
            [opt](const std::string& value)
            {
                const auto log_levels = magic_enum::enum_names<logger::detail::loglevel>();
                const auto valid_domains = magic_enum::enum_names<logger::domain>();

                const auto pos = value.find('=');
                if (pos == std::string::npos)
                {
                    return std::string("Must be in format domain=level");
                }

                const auto domain = value.substr(0, pos);
                if (!std::ranges::contains(valid_domains, domain))
                {
                    return std::format("Invalid domain: {}", domain);
                }

                const auto level = value.substr(pos + 1);
                if (!std::ranges::contains(log_levels, level))
                {
                    return std::format("Invalid log level: {}", level);
                }

                opt->log_levels.insert({domain, level});

                return std::string();
            });

    app.add_option("--logfile", opt->logfile, "absolute path to the logfile")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    return std::string();
                }
                return std::format("Logfile path must be absolute: {}", input.string());
            });

    app.add_flag("-v,--version", opt->version, "Show version information");

    // Everything else
    app.add_option("args", opt->args, "[PATH]...")->expected(0, -1);

    app.callback([opt]() { run_commandline(opt); });
}

std::expected<commandline::opts, std::string>
commandline::run(int argc, char* argv[]) noexcept
{
    const auto invoked = argc > 0 ? std::filesystem::path(argv[0]).filename().string()
                                  : std::string(PACKAGE_NAME);

    CLI::App app{invoked, "Copy and paste files between directories"};

    auto opt = std::make_shared<opts_data>();
    setup_commandline(app, opt);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return std::unexpected{std::format("{}: {}", invoked, e.what())};
    }

    auto args = opt->args;
    std::string command_name = invoked;
    if (invoked == PACKAGE_NAME)
    {
        if (args.empty())
        {
            command_name = name(command::help);
        }
        else
        {
            command_name = args.front();
            args.erase(args.begin());
        }
    }

    auto cmd = lookup(command_name);
    if (!cmd)
    {
        return std::unexpected{
            std::format("{}: {}",
                        command_name,
                        vfs::make_error_code(vfs::error_code::unrecognized_command).message())};
    }
    if (opt->help)
    {
        cmd = command::help;
    }

    logger::debug("command {} with {} args", name(cmd.value()), args.size());

    return commandline::opts{
        .command = cmd.value(),
        .args = args,
        .buffer = opt->buffer,
        .color = opt->color.empty()
                     ? std::nullopt
                     : magic_enum::enum_cast<config::color_mode>(opt->color),
        .version = opt->version,
    };
}
