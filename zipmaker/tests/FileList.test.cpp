#include "zipmaker/FileList.hpp"

#include "TestUtilities.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Size formatting")
{
    CHECK(FormatSize(0) == "0.0 B");
    CHECK(FormatSize(512) == "512.0 B");
    CHECK(FormatSize(1536) == "1.5 KB");
    CHECK(FormatSize(1024 * 1024) == "1.0 MB");
    CHECK(FormatSize(5ULL * 1024 * 1024 * 1024) == "5.0 GB");
    CHECK(FormatSize(2ULL * 1024 * 1024 * 1024 * 1024) == "2.0 TB");
}

SCENARIO("Managing the list of files to pack")
{
    TemporaryDirectory dir;
    WriteFile(dir / "a.txt", RepeatedText("a", 100));
    WriteFile(dir / "b.bin", RandomBytes(250));
    std::filesystem::create_directories(dir / "folder");

    FileList list;

    GIVEN("an empty list")
    {
        THEN("it has nothing")
        {
            CHECK(list.Empty());
            CHECK(list.Size() == 0);
            CHECK(list.TotalSize() == 0);
        }
    }

    GIVEN("two files added")
    {
        REQUIRE(list.Add(dir / "a.txt"));
        REQUIRE(list.Add(dir / "b.bin"));

        THEN("they are kept in order with their size")
        {
            REQUIRE(list.Size() == 2);
            CHECK(list.Items()[0].path.filename() == "a.txt");
            CHECK(list.Items()[0].size == 100);
            CHECK(list.Items()[1].path.filename() == "b.bin");
            CHECK(list.TotalSize() == 350);
        }

        WHEN("the same file is added again")
        {
            std::string error;
            const bool added = list.Add(dir.path / "folder" / ".." / "a.txt", error);

            THEN("it is rejected")
            {
                CHECK_FALSE(added);
                CHECK_THAT(error, ContainsSubstring("already in the list"));
                CHECK(list.Size() == 2);
            }
        }

        WHEN("the first one is removed")
        {
            list.Remove(0);

            THEN("only the second one remains")
            {
                REQUIRE(list.Size() == 1);
                CHECK(list.Items()[0].path.filename() == "b.bin");
                CHECK(list.TotalSize() == 250);
            }
        }

        WHEN("an out of range index is removed")
        {
            list.Remove(10);

            THEN("nothing changes")
            {
                CHECK(list.Size() == 2);
            }
        }

        WHEN("the list is cleared")
        {
            list.Clear();

            THEN("it is empty")
            {
                CHECK(list.Empty());
            }
        }
    }

    GIVEN("paths that are not regular files")
    {
        std::string error;

        THEN("missing files are rejected")
        {
            CHECK_FALSE(list.Add(dir / "missing.txt", error));
            CHECK_THAT(error, ContainsSubstring("not a regular file"));
        }

        THEN("directories are rejected")
        {
            CHECK_FALSE(list.Add(dir / "folder", error));
            CHECK(list.Empty());
        }
    }
}
