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
#include <string>
#include <system_error>
#include <vector>

#include <cstdio>

#include <doctest/doctest.h>

#include "action/action.hxx"

#include "vfs/error.hxx"
#include "vfs/selection.hxx"

TEST_SUITE("action::add" * doctest::description(""))
{
    const auto root = std::filesystem::temp_directory_path() / PACKAGE_NAME / "action-add";

    TEST_CASE("action::add")
    {
        if (std::filesystem::exists(root))
        {
            std::filesystem::remove_all(root);
        }
        std::filesystem::create_directories(root / "work" / "dir");
        std::ofstream(root / "work" / "a.txt") << "A";
        std::ofstream(root / "work" / "b.txt") << "B";

        const auto work = std::filesystem::canonical(root / "work");

        std::FILE* out = std::tmpfile();
        REQUIRE(out != nullptr);

        const action::context ctx{
            .record = root / "buffer.json",
            .cwd = work,
            .query = nullptr,
            .color = false,
            .out = out,
        };

        const auto load = [&]()
        {
            vfs::selection sel(ctx.record);
            sel.load();
            return sel.describe();
        };

        SUBCASE("files and directories are classified")
        {
            action::add(ctx, {"a.txt", "dir"}, false);

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK(sel.files().contains(work / "a.txt"));
            CHECK(sel.dirs().contains(work / "dir"));
        }

        SUBCASE("no arguments adds the working directory")
        {
            action::add(ctx, {}, false);

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK(sel.files().empty());
            CHECK(sel.dirs().contains(work));
        }

        SUBCASE("accumulates")
        {
            action::add(ctx, {"a.txt"}, false);
            action::add(ctx, {"b.txt"}, false);

            CHECK_EQ(load(), "2 files");
        }

        SUBCASE("same path twice is one entry")
        {
            action::add(ctx, {"a.txt", "./a.txt", (work / "a.txt").string()}, false);
            action::add(ctx, {"dir/../a.txt"}, false);

            CHECK_EQ(load(), "1 files");
        }

        SUBCASE("fresh replaces the buffer")
        {
            action::add(ctx, {"a.txt", "dir"}, false);
            action::add(ctx, {"b.txt"}, true);

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK_EQ(sel.size(), 1);
            CHECK(sel.files().contains(work / "b.txt"));
        }

        SUBCASE("fresh never reads a corrupt buffer")
        {
            std::ofstream(ctx.record) << "garbage";

            action::add(ctx, {"a.txt"}, true);
            CHECK_EQ(load(), "1 files");
        }

        SUBCASE("accumulate fails on a corrupt buffer")
        {
            std::ofstream(ctx.record) << "garbage";

            CHECK_THROWS_AS(action::add(ctx, {"a.txt"}, false), std::system_error);
        }

        SUBCASE("missing path saves nothing from the call")
        {
            action::add(ctx, {"b.txt"}, false);

            try
            {
                action::add(ctx, {"a.txt", "missing.txt"}, false);
                FAIL("add did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::not_found);
            }

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK_EQ(sel.size(), 1);
            CHECK(sel.files().contains(work / "b.txt"));
        }

        SUBCASE("prints names and a summary")
        {
            action::add(ctx, {"a.txt", "dir"}, false);

            std::fflush(out);
            std::rewind(out);
            std::string text;
            char buffer[256];
            std::size_t n = 0;
            while ((n = std::fread(buffer, 1, sizeof(buffer), out)) > 0)
            {
                text.append(buffer, n);
            }
            CHECK_EQ(text, "a.txt\ndir\n1 files and 1 dirs\n");
        }

        std::fclose(out);
        std::filesystem::remove_all(root);
    }
}
