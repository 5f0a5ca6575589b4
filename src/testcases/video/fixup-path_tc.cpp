#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/video/fixup-path.hpp"
#include "fauna/video/video-error.hpp"
#include "testcases/test-helpers.hpp"

namespace fauna
{
CATCH_TEST_CASE("fixup_path", "[fixup-path]")
{
   testing::TestDir dir;
   CATCH_REQUIRE(!file_put_contents(dir("clip.mp4"), "not really a video"));
   CATCH_REQUIRE(mkdir_p(dir("store")));
   CATCH_REQUIRE(!file_put_contents(dir("store/metadata.yaml"), "%YAML:1.0\n"));

   CATCH_SECTION("existing-path-is-unchanged")
   {
      CATCH_REQUIRE(fixup_path(dir("clip.mp4")) == dir("clip.mp4"));
      CATCH_REQUIRE(fixup_path(dir("store")) == dir("store"));
   }

   CATCH_SECTION("basename-in-current-directory")
   {
      testing::ScopedChdir cd(dir.path);
      CATCH_REQUIRE(fixup_path("/some/old/machine/clip.mp4") == "clip.mp4");
      CATCH_REQUIRE(fixup_path("/some/old/machine/clip.mp4", true)
                    == "clip.mp4");
   }

   CATCH_SECTION("frame-store-directory-in-current-directory")
   {
      testing::ScopedChdir cd(dir.path);
      // 'metadata.yaml' is not in the current directory, but 'store' is
      CATCH_REQUIRE(fixup_path("/old/place/store/metadata.yaml") == "store");
   }

   CATCH_SECTION("not-found")
   {
      testing::ScopedChdir cd(dir.path);
      CATCH_REQUIRE_THROWS_AS(fixup_path("/old/place/other.mp4"),
                              VideoNotFoundError);
      CATCH_REQUIRE_THROWS_AS(fixup_path("/old/place/other/metadata.yaml"),
                              VideoNotFoundError);
   }
}

} // namespace fauna
