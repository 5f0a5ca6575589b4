#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/utils/file-system.hpp"
#include "testcases/test-helpers.hpp"

namespace fauna
{
CATCH_TEST_CASE("PathHelpers", "[path-helpers]")
{
   CATCH_SECTION("basename-dirname-ext")
   {
      CATCH_REQUIRE(basename("/data/videos/centered_pair.mp4")
                    == "centered_pair.mp4"s);
      CATCH_REQUIRE(basename("/data/videos/centered_pair.mp4", true)
                    == "centered_pair"s);
      CATCH_REQUIRE(dirname("/data/videos/centered_pair.mp4")
                    == "/data/videos"s);
      CATCH_REQUIRE(file_ext("/data/videos/centered_pair.mp4") == ".mp4"s);
      CATCH_REQUIRE(file_ext("/data/videos/store") == ""s);
      CATCH_REQUIRE(extensionless("/data/a.h5") == "/data/a"s);
      CATCH_REQUIRE(path_join("/data", "a.h5") == "/data/a.h5"s);
      CATCH_REQUIRE(path_join("/data", "/b/a.h5") == "/b/a.h5"s);
   }
}

CATCH_TEST_CASE("FileSystem", "[file-system]")
{
   CATCH_SECTION("put-get-list-remove")
   {
      testing::TestDir dir;
      CATCH_REQUIRE(is_directory(dir.path));

      const auto fname = dir("a.txt");
      CATCH_REQUIRE(!file_put_contents(fname, "The quick brown fox"));
      CATCH_REQUIRE(is_regular_file(fname));
      CATCH_REQUIRE(file_get_contents(fname) == "The quick brown fox"s);

      CATCH_REQUIRE(mkdir_p(dir("x/y/z")));
      CATCH_REQUIRE(is_directory(dir("x/y/z")));
      CATCH_REQUIRE(!file_put_contents(dir("b.txt"), ""));

      const auto files = list_directory(dir.path);
      CATCH_REQUIRE(files.size() == 2); // directories are not listed
      CATCH_REQUIRE(basename(files[0]) == "a.txt"s);
      CATCH_REQUIRE(basename(files[1]) == "b.txt"s);

      CATCH_REQUIRE(!delete_file(fname));
      CATCH_REQUIRE(!is_regular_file(fname));

      remove_all(dir("x"));
      CATCH_REQUIRE(!is_directory(dir("x")));

      CATCH_REQUIRE_THROWS(file_get_contents(dir("missing.txt")));
      CATCH_REQUIRE_THROWS(list_directory(dir("missing")));
   }
}

} // namespace fauna
