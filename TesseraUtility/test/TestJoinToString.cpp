#include <TesseraUtility/joinToString.h>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace TesseraUtility;

TEST_CASE("joinToString") {
  SUBCASE("empty collection") {
    std::vector<std::string> assets;
    CHECK(joinToString(assets, ", ") == "");
  }

  SUBCASE("single element has no separator") {
    std::vector<std::string> assets{"scene-a"};
    CHECK(joinToString(assets, ", ") == "scene-a");
  }

  SUBCASE("separates consecutive elements") {
    std::vector<std::string> assets{"scene-a", "scene-b", "scene-c"};
    CHECK(joinToString(assets, ", ") == "scene-a, scene-b, scene-c");
  }
}
