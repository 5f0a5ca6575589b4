#define CATCH_CONFIG_PREFIX_ALL

#include <algorithm>
#include <iterator>

#include <catch2/catch.hpp>

#include "stdinc.hpp"

#include "fauna/utils/string-utils.hpp"

namespace fauna
{
CATCH_TEST_CASE("StrReplace", "[str-replace]")
{
   CATCH_SECTION("str-replace")
   {
      const auto s = str_replace(
          "Spain", "Germany", "The rain in Spain falls mainly in the plains.");
      CATCH_REQUIRE(s == "The rain in Germany falls mainly in the plains."s);

      CATCH_REQUIRE(str_replace("abc", "xyz", "abcabc") == "xyzxyz"s);
      CATCH_REQUIRE(str_replace("", "xyz", "abcabc") == "abcabc"s);
      CATCH_REQUIRE(str_replace("abc", "xyz", "") == ""s);
      CATCH_REQUIRE(str_replace("abc", "", "abcabc") == ""s);
   }
}

CATCH_TEST_CASE("Explode", "[explode]")
{
   CATCH_SECTION("explode")
   {
      const auto parts = explode("png,jpg,,bmp", ",");
      CATCH_REQUIRE(parts.size() == 4);
      CATCH_REQUIRE(parts[0] == "png"s);
      CATCH_REQUIRE(parts[2] == ""s);
      CATCH_REQUIRE(parts[3] == "bmp"s);

      const auto collapsed = explode("png,jpg,,bmp", ",", true);
      CATCH_REQUIRE(collapsed.size() == 3);

      const vector<string> opts = {"a", "b", "c"};
      CATCH_REQUIRE(implode(cbegin(opts), cend(opts), ",") == "a,b,c"s);
   }
}

CATCH_TEST_CASE("StringHelpers", "[string-helpers]")
{
   CATCH_SECTION("lowercase-and-trim")
   {
      CATCH_REQUIRE(string_to_lowercase("Video.MP4") == "video.mp4"s);
      CATCH_REQUIRE(trim_copy("  frames \n") == "frames"s);
      CATCH_REQUIRE(begins_with("metadata.yaml"s, "meta"s));
      CATCH_REQUIRE(ends_with("metadata.yaml"s, ".yaml"s));
      CATCH_REQUIRE(!ends_with("a"s, ".yaml"s));
   }

   CATCH_SECTION("lexical-cast")
   {
      int i = 0;
      CATCH_REQUIRE(!lexical_cast("42", i));
      CATCH_REQUIRE(i == 42);
      CATCH_REQUIRE(lexical_cast("42x", i));
      double d = 0.0;
      CATCH_REQUIRE(!lexical_cast("0.25", d));
      CATCH_REQUIRE(d == 0.25);
   }
}

} // namespace fauna
