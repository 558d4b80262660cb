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
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include <glaze/glaze.hpp>

#include "vfs/error.hxx"
#include "vfs/selection.hxx"

#include "vfs/utils/file-ops.hxx"

#include "logger.hxx"

namespace selection_disk_format
{
struct selection_data final
{
    std::vector<std::string> files;
    std::vector<std::string> dirs;
};
} // namespace selection_disk_format

vfs::selection::selection(const std::filesystem::path& record) noexcept : record_(record) {}

void
vfs::selection::load()
{
    this->files_.clear();
    this->dirs_.clear();

    if (!std::filesystem::exists(this->record_))
    {
        logger::debug<logger::domain::selection>("no buffer at {}", this->record_.string());
        return;
    }

    const auto buffer = vfs::utils::read_file(this->record_);
    if (!buffer)
    {
        throw std::system_error(buffer.error(), this->record_.string());
    }

    selection_disk_format::selection_data data;
    const auto ec =
        glz::read<glz::opts{.error_on_unknown_keys = false}>(data, buffer.value());
    if (ec)
    {
        logger::error<logger::domain::selection>("Failed to decode buffer {}: {}",
                                                 this->record_.string(),
                                                 glz::format_error(ec, buffer.value()));
        vfs::raise(vfs::error_code::corrupt_buffer, this->record_.string());
    }

    for (const auto& file : data.files)
    {
        if (!std::filesystem::path(file).is_absolute())
        {
            vfs::raise(vfs::error_code::corrupt_buffer,
                       std::format("{}: relative path '{}'", this->record_.string(), file));
        }
        this->files_.insert(file);
    }
    for (const auto& dir : data.dirs)
    {
        if (!std::filesystem::path(dir).is_absolute())
        {
            vfs::raise(vfs::error_code::corrupt_buffer,
                       std::format("{}: relative path '{}'", this->record_.string(), dir));
        }
        if (this->files_.contains(dir))
        {
            vfs::raise(vfs::error_code::corrupt_buffer,
                       std::format("{}: '{}' is both a file and a dir",
                                   this->record_.string(),
                                   dir));
        }
        this->dirs_.insert(dir);
    }

    logger::debug<logger::domain::selection>("loaded {} files, {} dirs from {}",
                                             this->files_.size(),
                                             this->dirs_.size(),
                                             this->record_.string());
}

void
vfs::selection::save() const
{
    selection_disk_format::selection_data data;
    data.files.reserve(this->files_.size());
    for (const auto& file : this->files_)
    {
        data.files.push_back(file.string());
    }
    data.dirs.reserve(this->dirs_.size());
    for (const auto& dir : this->dirs_)
    {
        data.dirs.push_back(dir.string());
    }

    const auto buffer = glz::write_json(data);
    if (!buffer)
    {
        logger::error<logger::domain::selection>("Failed to create JSON: {}",
                                                 glz::format_error(buffer));
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                this->record_.string());
    }

    const auto result = vfs::utils::write_file(this->record_, buffer.value());
    if (!result)
    {
        throw std::system_error(result.error(), this->record_.string());
    }

    logger::debug<logger::domain::selection>("saved {} files, {} dirs to {}",
                                             this->files_.size(),
                                             this->dirs_.size(),
                                             this->record_.string());
}

void
vfs::selection::clear()
{
    this->files_.clear();
    this->dirs_.clear();
    this->save();
}

std::string
vfs::selection::describe() const noexcept
{
    if (!this->files_.empty() && !this->dirs_.empty())
    {
        return std::format("{} files and {} dirs", this->files_.size(), this->dirs_.size());
    }
    if (!this->files_.empty())
    {
        return std::format("{} files", this->files_.size());
    }
    if (!this->dirs_.empty())
    {
        return std::format("{} dirs", this->dirs_.size());
    }
    return "";
}

bool
vfs::selection::empty() const noexcept
{
    return this->files_.empty() && this->dirs_.empty();
}

std::size_t
vfs::selection::size() const noexcept
{
    return this->files_.size() + this->dirs_.size();
}

const std::set<std::filesystem::path>&
vfs::selection::files() const noexcept
{
    return this->files_;
}

const std::set<std::filesystem::path>&
vfs::selection::dirs() const noexcept
{
    return this->dirs_;
}

void
vfs::selection::add_file(const std::filesystem::path& path) noexcept
{
    this->dirs_.erase(path);
    this->files_.insert(path);
}

void
vfs::selection::add_dir(const std::filesystem::path& path) noexcept
{
    this->files_.erase(path);
    this->dirs_.insert(path);
}

void
vfs::selection::remove_file(const std::filesystem::path& path) noexcept
{
    this->files_.erase(path);
}

void
vfs::selection::remove_dir(const std::filesystem::path& path) noexcept
{
    this->dirs_.erase(path);
}

const std::filesystem::path&
vfs::selection::record() const noexcept
{
    return this->record_;
}
