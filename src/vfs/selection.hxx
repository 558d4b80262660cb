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
#include <set>
#include <string>
#include <string_view>

namespace vfs
{
/**
 * The selection buffer, the set of files and directories marked
 * by one invocation to be pasted or deleted by a later one.
 *
 * Every command builds its own instance from the on disk record,
 * nothing is shared between instances. Last save wins.
 */
class selection final
{
  public:
    selection() = delete;
    explicit selection(const std::filesystem::path& record) noexcept;
    ~selection() noexcept = default;
    selection(const selection& other) = delete;
    selection(selection&& other) = delete;
    selection& operator=(const selection& other) = delete;
    selection& operator=(selection&& other) = delete;

    /**
     * Replace the in memory sets with the record contents.
     * A missing record loads as empty.
     *
     * @throws std::system_error vfs::error_code::corrupt_buffer if the record
     *         is not a valid selection, or the read error
     */
    void load();

    /**
     * Write the in memory sets to the record.
     *
     * @throws std::system_error on write failure
     */
    void save() const;

    /**
     * Empty both sets and save.
     */
    void clear();

    // "N files and M dirs", "N files", "M dirs" or ""
    [[nodiscard]] std::string describe() const noexcept;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const std::set<std::filesystem::path>& files() const noexcept;
    [[nodiscard]] const std::set<std::filesystem::path>& dirs() const noexcept;

    // a path is never in both sets, adding to one removes it from the other
    void add_file(const std::filesystem::path& path) noexcept;
    void add_dir(const std::filesystem::path& path) noexcept;

    void remove_file(const std::filesystem::path& path) noexcept;
    void remove_dir(const std::filesystem::path& path) noexcept;

    [[nodiscard]] const std::filesystem::path& record() const noexcept;

  private:
    std::filesystem::path record_;

    std::set<std::filesystem::path> files_;
    std::set<std::filesystem::path> dirs_;
};

namespace selection_disk_format
{
constexpr std::string_view filename{"buffer.json"};
} // namespace selection_disk_format
} // namespace vfs
