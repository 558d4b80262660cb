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

#include "vfs/collision.hxx"
#include "vfs/error.hxx"
#include "vfs/selection.hxx"

static std::string
output(std::FILE* file)
{
    std::fflush(file);
    std::rewind(file);

    std::string result;
    char buffer[256];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0)
    {
        result.append(buffer, n);
    }
    return result;
}

TEST_SUITE("action::paste" * doctest::description(""))
{
    const auto root = std::filesystem::temp_directory_path() / PACKAGE_NAME / "action-paste";

    TEST_CASE("action::paste")
    {
        if (std::filesystem::exists(root))
        {
            std::filesystem::remove_all(root);
        }
        std::filesystem::create_directories(root / "src");
        std::filesystem::create_directories(root / "dst");
        std::ofstream(root / "src" / "a.txt") << "A";
        std::ofstream(root / "src" / "b.txt") << "B";

        const auto src = std::filesystem::canonical(root / "src");
        const auto dst = std::filesystem::canonical(root / "dst");

        std::FILE* out = std::tmpfile();
        REQUIRE(out != nullptr);

        std::size_t asked = 0;
        auto answer = vfs::collision_resolve::skip;

        const action::context ctx{
            .record = root / "buffer.json",
            .cwd = dst,
            .query = [&](const std::filesystem::path&, const std::filesystem::path&)
            {
                asked += 1;
                return answer;
            },
            .color = false,
            .out = out,
        };

        const auto select = [&](const std::vector<std::filesystem::path>& files)
        {
            vfs::selection sel(ctx.record);
            for (const auto& file : files)
            {
                sel.add_file(file);
            }
            sel.save();
        };

        const auto remaining = [&]()
        {
            vfs::selection sel(ctx.record);
            sel.load();
            return sel.size();
        };

        SUBCASE("both files into an empty directory")
        {
            select({src / "a.txt", src / "b.txt"});

            action::paste(ctx, {}, false);

            CHECK_EQ(output(out), "2/2 files, 0/0 dirs copied, 0 skipped\n");
            CHECK_EQ(remaining(), 0);
            CHECK(std::filesystem::exists(dst / "a.txt"));
            CHECK(std::filesystem::exists(dst / "b.txt"));
            CHECK_EQ(asked, 0);
        }

        SUBCASE("declined overwrite stays in the buffer")
        {
            std::ofstream(dst / "a.txt") << "existing";
            select({src / "a.txt"});

            action::paste(ctx, {}, false);

            CHECK_EQ(output(out), "0/1 files, 0/0 dirs copied, 1 skipped\n");
            CHECK_EQ(remaining(), 1);
            CHECK_EQ(asked, 1);
        }

        SUBCASE("destination argument")
        {
            std::filesystem::create_directories(root / "other");
            select({src / "a.txt"});

            action::paste(ctx, {(root / "other").string()}, false);

            CHECK(std::filesystem::exists(root / "other" / "a.txt"));
            CHECK_FALSE(std::filesystem::exists(dst / "a.txt"));
        }

        SUBCASE("destination must be a directory")
        {
            select({src / "a.txt"});

            try
            {
                action::paste(ctx, {(src / "b.txt").string()}, false);
                FAIL("paste did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::argument_error);
            }
            CHECK_EQ(remaining(), 1);
        }

        SUBCASE("too many arguments")
        {
            select({src / "a.txt"});

            try
            {
                action::paste(ctx, {"one", "two"}, false);
                FAIL("paste did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::too_many_arguments);
            }
        }

        SUBCASE("empty buffer")
        {
            try
            {
                action::paste(ctx, {}, false);
                FAIL("paste did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::empty_selection);
            }
        }

        SUBCASE("paste-clear empties the buffer even when skipping")
        {
            std::ofstream(dst / "a.txt") << "existing";
            select({src / "a.txt", src / "b.txt"});

            action::paste(ctx, {}, true);

            CHECK_EQ(output(out), "1/2 files, 0/0 dirs copied, 1 skipped\n");
            CHECK_EQ(remaining(), 0);
        }

        SUBCASE("failure saves progress and prints the summary")
        {
            select({src / "a.txt", src / "b.txt"});
            std::filesystem::remove(src / "b.txt");

            CHECK_THROWS_AS(action::paste(ctx, {}, false), std::filesystem::filesystem_error);

            CHECK_EQ(output(out), "1/2 files, 0/0 dirs copied, 0 skipped\n");

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK_EQ(sel.size(), 1);
            CHECK(sel.files().contains(src / "b.txt"));
        }

        SUBCASE("paste-clear clears on failure")
        {
            select({src / "a.txt", src / "b.txt"});
            std::filesystem::remove(src / "b.txt");

            CHECK_THROWS_AS(action::paste(ctx, {}, true), std::filesystem::filesystem_error);
            CHECK_EQ(remaining(), 0);
        }

        SUBCASE("abort saves progress")
        {
            std::ofstream(dst / "b.txt") << "existing";
            select({src / "a.txt", src / "b.txt"});

            const action::context aborting{
                .record = ctx.record,
                .cwd = dst,
                .query = [](const std::filesystem::path&, const std::filesystem::path& destination)
                    -> vfs::collision_resolve
                { vfs::raise(vfs::error_code::aborted, destination.string()); },
                .color = false,
                .out = out,
            };

            try
            {
                action::paste(aborting, {}, false);
                FAIL("paste did not throw");
            }
            catch (const std::system_error& e)
            {
                CHECK_EQ(e.code(), vfs::error_code::aborted);
            }

            vfs::selection sel(ctx.record);
            sel.load();
            CHECK_EQ(sel.size(), 1);
            CHECK(sel.files().contains(src / "b.txt"));
        }

        std::fclose(out);
        std::filesystem::remove_all(root);
    }
}
