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
#include <string>

#include <cstdint>

#include "vfs/collision.hxx"
#include "vfs/selection.hxx"

namespace vfs::transfer
{
struct copy_stats final
{
    std::uint64_t files_total{0};
    std::uint64_t files_copied{0};
    std::uint64_t dirs_total{0};
    std::uint64_t dirs_copied{0};
    std::uint64_t skipped{0};

    // "X/Y files, A/B dirs copied, S skipped"
    [[nodiscard]] std::string summary() const noexcept;
};

struct remove_stats final
{
    std::uint64_t files_total{0};
    std::uint64_t files_removed{0};
    std::uint64_t dirs_total{0};
    std::uint64_t dirs_removed{0};

    // "X files Y dirs deleted"
    [[nodiscard]] std::string summary() const noexcept;
};

/**
 * @brief copy
 *
 * - Copy every selected directory, then every selected file, into target.
 *   Copied entries are removed from the selection, skipped entries stay.
 *   The selection is not saved, the caller persists it.
 *
 * @param[in,out] sel The selection to consume
 * @param[in] target Destination directory
 * @param[in,out] resolver Consulted for every destination that already exists
 * @param[out] stats Updated as entries are processed, valid after a throw
 *
 * @throws std::filesystem::filesystem_error on the first failing entry,
 *         std::system_error vfs::error_code::aborted from the resolver
 */
void copy(vfs::selection& sel, const std::filesystem::path& target,
          vfs::collision_resolver& resolver, copy_stats& stats);

/**
 * @brief remove
 *
 * - Delete every selected file, then every selected directory recursively.
 *   Deleted entries are removed from the selection.
 *
 * @param[in,out] sel The selection to consume
 * @param[out] stats Updated as entries are processed, valid after a throw
 *
 * @throws std::filesystem::filesystem_error on the first failing entry
 */
void remove(vfs::selection& sel, remove_stats& stats);
} // namespace vfs::transfer
