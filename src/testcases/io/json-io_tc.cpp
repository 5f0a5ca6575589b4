#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "fauna/io/json-io.hpp"

namespace fauna
{
CATCH_TEST_CASE("json-io", "[json-io]")
{
   const auto o = parse_json(R"V0G0N(
{
   "name":   "session-1",
   "n":      12,
   "scale":  0.5,
   "flag":   true,
   "values": [1, 2.5, null],
   "nested": {"x": 3}
}
)V0G0N");

   CATCH_SECTION("load-keys")
   {
      const string op = "testing";
      CATCH_REQUIRE(json_load_key<string>(o, "name", op) == "session-1");
      CATCH_REQUIRE(json_load_key<int>(o, "n", op) == 12);
      CATCH_REQUIRE(json_load_key<double>(o, "scale", op) == Approx(0.5));
      CATCH_REQUIRE(json_load_key<bool>(o, "flag", op));

      const auto values = json_load_key<vector<double>>(o, "values", op);
      CATCH_REQUIRE(values.size() == 3);
      CATCH_REQUIRE(values[1] == Approx(2.5));
      CATCH_REQUIRE(std::isnan(values[2]));

      CATCH_REQUIRE_THROWS(json_load_key<int>(o, "missing", op));
      CATCH_REQUIRE_THROWS(json_load_key<int>(o, "name", op));
      CATCH_REQUIRE_THROWS(json_load_key<string>(o, "n", op));
   }

   CATCH_SECTION("try-load-keys")
   {
      int n = -1;
      CATCH_REQUIRE(json_try_load_key(n, o, "n", "testing", false));
      CATCH_REQUIRE(n == 12);

      bool flag = false;
      CATCH_REQUIRE(!json_try_load_key(flag, o, "name", "testing", false));
      CATCH_REQUIRE(!json_try_load_key(flag, o, "missing", "testing", false));
      CATCH_REQUIRE(flag == false);
   }

   CATCH_SECTION("has-key")
   {
      CATCH_REQUIRE(has_key(o, "nested"));
      CATCH_REQUIRE(has_key(get_key(o, "nested"), "x"));
      CATCH_REQUIRE(!has_key(o, "x"));
      CATCH_REQUIRE(!has_key(o["values"], "0"));
      CATCH_REQUIRE_THROWS(get_key(o, "x"));
   }

   CATCH_SECTION("parse-and-encode")
   {
      Json::Value val;
      CATCH_REQUIRE(!parse_json("{\"a\": ", val));
      CATCH_REQUIRE_THROWS(parse_json("[1, 2"));

      CATCH_REQUIRE(parse_json(json_encode(o), val));
      CATCH_REQUIRE(val == o);
      CATCH_REQUIRE(json_encode(o).find('\n') == string::npos);

      const vector<int> xs = {3, 1, 4};
      CATCH_REQUIRE(json_encode(json_save(cbegin(xs), cend(xs))) == "[3,1,4]");
   }
}

} // namespace fauna
