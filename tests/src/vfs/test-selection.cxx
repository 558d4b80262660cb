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
#include <fstream>
#include <set>
#include <string>
#include <system_error>

#include <doctest/doctest.h>

#include "vfs/error.hxx"
#include "vfs/selection.hxx"

TEST_SUITE("vfs::selection" * doctest::description(""))
{
    const auto root = std::filesystem::temp_directory_path() / PACKAGE_NAME / "selection";

    TEST_CASE("vfs::selection")
    {
        if (std::filesystem::exists(root))
        {
            std::filesystem::remove_all(root);
        }
        std::filesystem::create_directories(root);

        const auto record = root / "buffer.json";

        SUBCASE("missing record loads empty")
        {
            vfs::selection sel(record);
            sel.load();

            CHECK(sel.empty());
            CHECK_EQ(sel.describe(), "");
            CHECK_FALSE(std::filesystem::exists(record));
        }

        SUBCASE("save then load")
        {
            {
                vfs::selection sel(record);
                sel.add_file("/a/file.txt");
                sel.add_file("/b/other.txt");
                sel.add_dir("/a/dir");
                sel.save();
            }

            vfs::selection sel(record);
            sel.load();

            const std::set<std::filesystem::path> files{"/a/file.txt", "/b/other.txt"};
            const std::set<std::filesystem::path> dirs{"/a/dir"};
            CHECK_EQ(sel.files(), files);
            CHECK_EQ(sel.dirs(), dirs);
            CHECK_EQ(sel.size(), 3);
        }

        SUBCASE("load replaces in memory state")
        {
            vfs::selection sel(record);
            sel.add_file("/a/file.txt");
            sel.save();

            sel.add_file("/unsaved.txt");
            sel.load();

            CHECK_EQ(sel.files().size(), 1);
            CHECK(sel.files().contains("/a/file.txt"));
        }

        SUBCASE("adding twice keeps one entry")
        {
            vfs::selection sel(record);
            sel.add_file("/a/file.txt");
            sel.add_file("/a/file.txt");

            CHECK_EQ(sel.files().size(), 1);
        }

        SUBCASE("a path is never in both sets")
        {
            vfs::selection sel(record);
            sel.add_file("/a/thing");
            sel.add_dir("/a/thing");

            CHECK(sel.files().empty());
            CHECK(sel.dirs().contains("/a/thing"));

            sel.add_file("/a/thing");
            CHECK(sel.dirs().empty());
            CHECK(sel.files().contains("/a/thing"));
        }

        SUBCASE("clear persists empty sets")
        {
            vfs::selection sel(record);
            sel.add_file("/a/file.txt");
            sel.save();

            sel.clear();
            CHECK(sel.empty());

            vfs::selection reloaded(record);
            reloaded.load();
            CHECK(reloaded.empty());
            CHECK(std::filesystem::exists(record));
        }

        SUBCASE("describe")
        {
            vfs::selection sel(record);
            CHECK_EQ(sel.describe(), "");

            sel.add_file("/a");
            sel.add_file("/b");
            CHECK_EQ(sel.describe(), "2 files");

            sel.add_dir("/c");
            CHECK_EQ(sel.describe(), "2 files and 1 dirs");

            sel.remove_file("/a");
            sel.remove_file("/b");
            CHECK_EQ(sel.describe(), "1 dirs");
        }

        SUBCASE("unknown keys are ignored")
        {
            std::ofstream(record) << R"({"files":["/x"],"dirs":[],"version":3})";

            vfs::selection sel(record);
            sel.load();
            CHECK(sel.files().contains("/x"));
        }

        SUBCASE("corrupt record")
        {
            std::ofstream(record) << "{ not json";

            vfs::selection sel(record);
            try
            {
                sel.load();
                FAIL("load did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::corrupt_buffer);
            }

            // not reset
            CHECK_EQ(std::ifstream(record).peek(), '{');
        }

        SUBCASE("wrong structure")
        {
            std::ofstream(record) << R"({"files":"/x","dirs":[]})";

            vfs::selection sel(record);
            CHECK_THROWS_AS(sel.load(), std::system_error);
        }

        SUBCASE("relative path in record")
        {
            std::ofstream(record) << R"({"files":["relative.txt"],"dirs":[]})";

            vfs::selection sel(record);
            CHECK_THROWS_AS(sel.load(), std::system_error);
        }

        SUBCASE("path in both lists")
        {
            std::ofstream(record) << R"({"files":["/x"],"dirs":["/x"]})";

            vfs::selection sel(record);
            CHECK_THROWS_AS(sel.load(), std::system_error);
        }

        SUBCASE("instances do not share state")
        {
            vfs::selection a(record);
            vfs::selection b(record);
            a.add_file("/only-in-a");

            CHECK(b.empty());
        }

        std::filesystem::remove_all(root);
    }
}
