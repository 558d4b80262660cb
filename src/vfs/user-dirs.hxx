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

#include <filesystem>

namespace vfs::user
{
[[nodiscard]] std::filesystem::path home() noexcept;
[[nodiscard]] std::filesystem::path data() noexcept;
[[nodiscard]] std::filesystem::path config() noexcept;
} // namespace vfs::user

namespace vfs::program
{
[[nodiscard]] std::filesystem::path config() noexcept;
void config(const std::filesystem::path& path) noexcept;

[[nodiscard]] std::filesystem::path data() noexcept;
void data(const std::filesystem::path& path) noexcept;
} // namespace vfs::program
