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
#include <system_error>
#include <vector>

#include "vfs/collision.hxx"
#include "vfs/selection.hxx"
#include "vfs/transfer.hxx"

#include "logger.hxx"

std::string
vfs::transfer::copy_stats::summary() const noexcept
{
    return std::format("{}/{} files, {}/{} dirs copied, {} skipped",
                       this->files_copied,
                       this->files_total,
                       this->dirs_copied,
                       this->dirs_total,
                       this->skipped);
}

std::string
vfs::transfer::remove_stats::summary() const noexcept
{
    return std::format("{} files {} dirs deleted", this->files_removed, this->dirs_removed);
}

static void
copy_regular_file(const std::filesystem::path& source, const std::filesystem::path& destination)
{
    // permissions are copied by copy_file, mtime is not
    std::filesystem::copy_file(source,
                               destination,
                               std::filesystem::copy_options::overwrite_existing);

    std::error_code ec;
    std::filesystem::last_write_time(destination, std::filesystem::last_write_time(source), ec);
    logger::warn_if<logger::domain::transfer>(bool(ec),
                                              "failed to set mtime on {}: {}",
                                              destination.string(),
                                              ec.message());
}

static void
copy_tree(const std::filesystem::path& source, const std::filesystem::path& destination)
{
    // no merging into an existing directory
    if (std::filesystem::exists(std::filesystem::symlink_status(destination)))
    {
        throw std::filesystem::filesystem_error("cannot copy directory",
                                                source,
                                                destination,
                                                std::make_error_code(std::errc::file_exists));
    }

    // listed before destination exists, it may be inside source
    // does not follow directory symlinks
    const std::vector<std::filesystem::directory_entry> entries(
        std::filesystem::recursive_directory_iterator(source),
        std::filesystem::recursive_directory_iterator());

    std::filesystem::create_directory(destination, source);

    for (const auto& entry : entries)
    {
        const auto relative = entry.path().lexically_relative(source);
        const auto target = destination / relative;

        logger::trace<logger::domain::transfer>("{} -> {}", entry.path().string(), target.string());

        if (entry.is_symlink())
        {
            std::filesystem::copy_symlink(entry.path(), target);
        }
        else if (entry.is_directory())
        {
            std::filesystem::create_directory(target, entry.path());
        }
        else if (entry.is_regular_file())
        {
            copy_regular_file(entry.path(), target);
        }
        else
        {
            logger::warn<logger::domain::transfer>("skipping special file {}",
                                                   entry.path().string());
        }
    }
}

/**
 * @return true if source may be written to destination
 */
static bool
check_overwrite(const std::filesystem::path& source, const std::filesystem::path& destination,
                vfs::collision_resolver& resolver)
{
    if (!std::filesystem::exists(std::filesystem::symlink_status(destination)))
    {
        return true;
    }

    std::error_code ec;
    if (std::filesystem::equivalent(source, destination, ec))
    {
        // src and dest are same file - do not overwrite (truncates)
        logger::warn<logger::domain::transfer>("{} is the source, skipping", destination.string());
        return false;
    }

    return resolver.resolve(source, destination).proceed;
}

void
vfs::transfer::copy(vfs::selection& sel, const std::filesystem::path& target,
                    vfs::collision_resolver& resolver, copy_stats& stats)
{
    // snapshot, the selection is modified while iterating
    const std::vector<std::filesystem::path> dirs{sel.dirs().cbegin(), sel.dirs().cend()};
    const std::vector<std::filesystem::path> files{sel.files().cbegin(), sel.files().cend()};

    stats.dirs_total = dirs.size();
    stats.files_total = files.size();

    for (const auto& dir : dirs)
    {
        const auto destination = target / dir.filename();
        if (!check_overwrite(dir, destination, resolver))
        {
            stats.skipped += 1;
            continue;
        }

        logger::info<logger::domain::transfer>("copy dir {} -> {}",
                                               dir.string(),
                                               destination.string());
        copy_tree(dir, destination);

        sel.remove_dir(dir);
        stats.dirs_copied += 1;
    }

    for (const auto& file : files)
    {
        const auto destination = target / file.filename();
        if (!check_overwrite(file, destination, resolver))
        {
            stats.skipped += 1;
            continue;
        }

        logger::info<logger::domain::transfer>("copy file {} -> {}",
                                               file.string(),
                                               destination.string());
        copy_regular_file(file, destination);

        sel.remove_file(file);
        stats.files_copied += 1;
    }
}

void
vfs::transfer::remove(vfs::selection& sel, remove_stats& stats)
{
    const std::vector<std::filesystem::path> files{sel.files().cbegin(), sel.files().cend()};
    const std::vector<std::filesystem::path> dirs{sel.dirs().cbegin(), sel.dirs().cend()};

    stats.files_total = files.size();
    stats.dirs_total = dirs.size();

    for (const auto& file : files)
    {
        logger::info<logger::domain::transfer>("remove file {}", file.string());
        if (!std::filesystem::remove(file))
        {
            throw std::filesystem::filesystem_error(
                "cannot remove",
                file,
                std::make_error_code(std::errc::no_such_file_or_directory));
        }

        sel.remove_file(file);
        stats.files_removed += 1;
    }

    for (const auto& dir : dirs)
    {
        logger::info<logger::domain::transfer>("remove dir {}", dir.string());
        if (std::filesystem::remove_all(dir) == 0)
        {
            throw std::filesystem::filesystem_error(
                "cannot remove",
                dir,
                std::make_error_code(std::errc::no_such_file_or_directory));
        }

        sel.remove_dir(dir);
        stats.dirs_removed += 1;
    }
}
