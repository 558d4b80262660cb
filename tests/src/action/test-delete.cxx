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

#include <cstdio>

#include <doctest/doctest.h>

#include "action/action.hxx"

#include "vfs/error.hxx"
#include "vfs/selection.hxx"

TEST_SUITE("action::del" * doctest::description(""))
{
    const auto root = std::filesystem::temp_directory_path() / PACKAGE_NAME / "action-delete";

    TEST_CASE("action::del")
    {
        if (std::filesystem::exists(root))
        {
            std::filesystem::remove_all(root);
        }
        std::filesystem::create_directories(root / "work" / "tree" / "sub");
        std::ofstream(root / "work" / "tree" / "sub" / "deep.txt") << "deep";
        std::ofstream(root / "work" / "a.txt") << "A";

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

        SUBCASE("removes files and directories")
        {
            action::add(ctx, {"a.txt", "tree"}, false);

            action::del(ctx, {});

            CHECK_FALSE(std::filesystem::exists(work / "a.txt"));
            CHECK_FALSE(std::filesystem::exists(work / "tree"));

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK(sel.empty());
        }

        SUBCASE("failed deletion stays selected")
        {
            action::add(ctx, {"a.txt", "tree"}, false);
            {
                vfs::selection sel(ctx.record);
                sel.load();
                sel.add_file(work / "vanished.txt");
                sel.save();
            }

            CHECK_THROWS_AS(action::del(ctx, {}), std::filesystem::filesystem_error);

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK_FALSE(sel.files().contains(work / "a.txt"));
            CHECK(sel.files().contains(work / "vanished.txt"));
            CHECK(sel.dirs().contains(work / "tree"));
        }

        SUBCASE("empty buffer")
        {
            try
            {
                action::del(ctx, {});
                FAIL("delete did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::empty_selection);
            }
        }

        SUBCASE("takes no arguments")
        {
            action::add(ctx, {"a.txt"}, false);

            try
            {
                action::del(ctx, {"a.txt"});
                FAIL("delete did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::argument_error);
            }
            CHECK(std::filesystem::exists(work / "a.txt"));
        }

        std::fclose(out);
        std::filesystem::remove_all(root);
    }
}
