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
#include <functional>
#include <optional>

#include <cstdint>

namespace vfs
{
enum class collision_resolve : std::uint8_t
{
    pending,
    overwrite,     // Overwrite current file / Ask
    overwrite_all, // Overwrite all existing files without prompt
    skip,          // Do not overwrite current file
    skip_all,      // Do not overwrite any files
};

/**
 * y -> overwrite, n -> skip, Y -> overwrite_all, N -> skip_all
 */
[[nodiscard]] std::optional<collision_resolve> collision_resolve_from_key(char key) noexcept;

/**
 * Decides what to do with a destination that already exists.
 * An "all" answer is kept for the rest of the run and suppresses the query.
 */
class collision_resolver final
{
  public:
    // asks the user, may throw to abort the transfer
    using query_t = std::function<collision_resolve(const std::filesystem::path& source,
                                                    const std::filesystem::path& destination)>;

    struct result final
    {
        std::filesystem::path destination;
        bool proceed;
    };

    collision_resolver() = delete;
    explicit collision_resolver(const query_t& query) noexcept;

    [[nodiscard]] result resolve(const std::filesystem::path& source,
                                 const std::filesystem::path& destination);

    [[nodiscard]] collision_resolve mode() const noexcept;

  private:
    query_t query_;
    collision_resolve mode_{collision_resolve::pending};
};
} // namespace vfs
