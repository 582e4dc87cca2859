#include "JsonFields.hpp"

#include "TestHeaders.hpp"

using namespace jm;

TEST_CASE("Integer fields", "[JsonFields]") {
  json j = {{"updatedAt", 1700000000000},
            {"created_at", "42"},
            {"ratio", 12.9},
            {"huge", 1e300},
            {"edge", 9223372036854775808.0},
            {"unsignedHuge", 18446744073709551615ULL},
            {"word", "soon"},
            {"missing", nullptr}};

  REQUIRE(*jsonInt64(j, "updatedAt") == 1700000000000LL);
  REQUIRE(*jsonInt64(j, "createdAt", "created_at") == 42);
  REQUIRE(*jsonInt64(j, "ratio") == 12);
  REQUIRE_FALSE(jsonInt64(j, "huge"));
  REQUIRE_FALSE(jsonInt64(j, "edge"));
  REQUIRE_FALSE(jsonInt64(j, "unsignedHuge"));
  REQUIRE_FALSE(jsonInt64(j, "word"));
  REQUIRE_FALSE(jsonInt64(j, "missing"));
  REQUIRE_FALSE(jsonInt64(json::array(), "updatedAt"));
}

TEST_CASE("Other field kinds", "[JsonFields]") {
  json j = {{"actualCost", "0.5"}, {"done", true}, {"name", "plan"}};
  REQUIRE(*jsonDouble(j, "actualCost") == 0.5);
  REQUIRE(*jsonBool(j, "done"));
  REQUIRE_FALSE(jsonBool(j, "name"));
  REQUIRE(*jsonString(j, "name") == "plan");
  REQUIRE_FALSE(jsonString(j, "done"));
}
