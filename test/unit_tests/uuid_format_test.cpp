#include <catch2/catch.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <uuidkit/core/uuid.hpp>

using namespace uuidkit;

TEST_CASE("toString renders the canonical form", "[UUID][format]") {
  REQUIRE(UUID::nil().toString() == "00000000-0000-0000-0000-000000000000");

  auto uuid = UUID::fromFields(0x123e4567, 0xe89b, 0x12d3, 0xa456, 0x426655440000);
  REQUIRE(uuid.value().toString() == "123e4567-e89b-12d3-a456-426655440000");

  REQUIRE(UUID::fromWords({0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff}).toString() ==
          "ffffffff-ffff-ffff-ffff-ffffffffffff");
}

TEST_CASE("toString zero-pads every group", "[UUID][format]") {
  auto uuid = UUID::fromFields(0x1, 0x2, 0x3, 0x4, 0x5);
  REQUIRE(uuid.value().toString() == "00000001-0002-0003-0004-000000000005");

  REQUIRE(UUID::fromWords({0, 0, 0x00000001, 0}).toString() ==
          "00000000-0000-0000-0000-000100000000");
}

TEST_CASE("toString inverts parse with lowercase output", "[UUID][format]") {
  const char* inputs[] = {
      "123e4567-e89b-12d3-a456-426655440000",
      "C232AB00-9414-11EC-B3C8-9F6BDECED846",
      "00000000-0000-0000-0000-000000000001",
      "fFfFfFfF-0000-aBcD-eF01-23456789AbCd",
  };
  for (const char* input : inputs) {
    std::string expected(input);
    for (auto& c : expected) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    REQUIRE(UUID::parse(input).value().toString() == expected);
  }
}

TEST_CASE("Stream output leaves the stream's flags alone", "[UUID][format]") {
  std::ostringstream ss;
  ss << std::uppercase << std::setfill('*');
  ss << UUID::parse("c232ab00-9414-11ec-b3c8-9f6bdeced846").value() << ' ' << std::setw(4) << 255;
  REQUIRE(ss.str() == "c232ab00-9414-11ec-b3c8-9f6bdeced846 *255");
}
