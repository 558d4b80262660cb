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

#pragma once

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstdint>

#include "settings/settings.hxx"

namespace commandline
{
enum class command : std::uint8_t
{
    add,
    add_fresh,
    paste,
    paste_clear,
    clear,
    help,
    list,
    del,
};

struct command_data final
{
    std::string_view name;
    commandline::command command;
    std::string_view args;
    std::string_view description;
};

inline constexpr std::array<command_data, 8> commands{{
    {"add", command::add, "[PATH]...", "Add paths to the buffer, default is the current directory"},
    {"add-fresh", command::add_fresh, "[PATH]...", "Replace the buffer with paths"},
    {"paste", command::paste, "[DIR]", "Copy the buffer into DIR, default is the current directory"},
    {"paste-clear", command::paste_clear, "[DIR]", "Paste, then empty the buffer"},
    {"clear", command::clear, "", "Empty the buffer"},
    {"help", command::help, "", "Show this help"},
    {"list", command::list, "", "Show the buffer contents"},
    {"delete", command::del, "", "Delete the buffer contents from disk"},
}};

[[nodiscard]] std::optional<command> lookup(const std::string_view name) noexcept;
[[nodiscard]] std::string_view name(const command command) noexcept;

struct opts final
{
    commandline::command command{commandline::command::help};
    std::vector<std::string> args;

    std::filesystem::path buffer;
    std::optional<config::color_mode> color{std::nullopt};

    bool version{false};
};

/**
 * The basename of argv[0] selects the command. When it is the program
 * name itself the first positional argument is the command.
 */
[[nodiscard]] std::expected<opts, std::string> run(int argc, char* argv[]) noexcept;
} // namespace commandline
