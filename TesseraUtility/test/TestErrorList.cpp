#include <TesseraUtility/ErrorList.h>

#include <doctest/doctest.h>

#include <string>
#include <utility>

using namespace TesseraUtility;

TEST_CASE("ErrorList") {
  ErrorList errorList;

  SUBCASE("starts empty") {
    CHECK(errorList.errors.empty());
    CHECK(errorList.warnings.empty());
    CHECK(!errorList.hasErrors());
    CHECK(!errorList.hasWarnings());
    CHECK(!errorList);
  }

  SUBCASE("warnings do not count as errors") {
    errorList.emplaceWarning("scene-a: read timed out");
    CHECK(errorList.hasWarnings());
    CHECK(!errorList.hasErrors());
    CHECK(!errorList);
  }

  SUBCASE("an error makes the list truthy") {
    errorList.emplaceError("no asset produced valid pixels");
    CHECK(errorList.hasErrors());
    CHECK(errorList);
  }

  SUBCASE("formats as empty string when nothing was recorded") {
    CHECK(errorList.format("Tile 3/2/1:") == "");
  }

  SUBCASE("formats errors before warnings") {
    errorList.emplaceWarning("scene-b: not found");
    errorList.emplaceError("no asset produced valid pixels");
    errorList.emplaceWarning("scene-c: decode error");
    CHECK(
        errorList.format("Tile 3/2/1:") ==
        "Tile 3/2/1:\n- [Error] no asset produced valid pixels"
        "\n- [Warning] scene-b: not found\n- [Warning] scene-c: decode error");
  }

  SUBCASE("merges by copy") {
    ErrorList other = ErrorList::warning("scene-d: not found");
    other.emplaceError("fatal");
    errorList.merge(other);
    CHECK(errorList.warnings.size() == 1);
    CHECK(errorList.errors.size() == 1);
    CHECK(other.warnings.size() == 1);
  }

  SUBCASE("merges by move") {
    errorList.emplaceWarning("first");
    ErrorList other = ErrorList::warning("second");
    errorList.merge(std::move(other));
    REQUIRE(errorList.warnings.size() == 2);
    CHECK(errorList.warnings[0] == "first");
    CHECK(errorList.warnings[1] == "second");
  }

  SUBCASE("factory functions") {
    CHECK(ErrorList::error("e").errors.size() == 1);
    CHECK(ErrorList::warning("w").warnings.size() == 1);
  }
}
