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
#include <optional>

#include <magic_enum/magic_enum.hpp>

#include "vfs/collision.hxx"

#include "logger.hxx"

std::optional<vfs::collision_resolve>
vfs::collision_resolve_from_key(const char key) noexcept
{
    switch (key)
    {
        case 'y':
            return collision_resolve::overwrite;
        case 'n':
            return collision_resolve::skip;
        case 'Y':
            return collision_resolve::overwrite_all;
        case 'N':
            return collision_resolve::skip_all;
        default:
            return std::nullopt;
    }
}

vfs::collision_resolver::collision_resolver(const query_t& query) noexcept : query_(query) {}

vfs::collision_resolver::result
vfs::collision_resolver::resolve(const std::filesystem::path& source,
                                 const std::filesystem::path& destination)
{
    // reusing previous action choice for this run
    if (this->mode_ == collision_resolve::overwrite_all)
    {
        return {destination, true};
    }
    if (this->mode_ == collision_resolve::skip_all)
    {
        return {destination, false};
    }

    this->mode_ = this->query_(source, destination);

    logger::debug<logger::domain::transfer>("collision {} -> {}: {}",
                                            source.string(),
                                            destination.string(),
                                            magic_enum::enum_name(this->mode_));

    const bool proceed = this->mode_ == collision_resolve::overwrite ||
                         this->mode_ == collision_resolve::overwrite_all;
    return {destination, proceed};
}

vfs::collision_resolve
vfs::collision_resolver::mode() const noexcept
{
    return this->mode_;
}
