#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include <uuidkit/core/uuid.hpp>

using namespace uuidkit;

TEST_CASE("parse accepts canonical strings in any case", "[UUID][parse]") {
  auto lower = UUID::parse("123e4567-e89b-12d3-a456-426655440000");
  auto upper = UUID::parse("123E4567-E89B-12D3-A456-426655440000");
  auto mixed = UUID::parse("123e4567-E89b-12D3-a456-426655440000");

  REQUIRE(lower.ok());
  REQUIRE(upper.ok());
  REQUIRE(mixed.ok());
  REQUIRE(lower.value() == upper.value());
  REQUIRE(lower.value() == mixed.value());
}

TEST_CASE("parse rejects strings of the wrong length", "[UUID][parse]") {
  SECTION("Short") {
    auto result = UUID::parse("short");
    REQUIRE(result.isError());
    const auto& err = result.error();
    REQUIRE(err.code() == ErrorCode::InvalidLength);
    REQUIRE(err.expectedLength() == 36);
    REQUIRE(err.actualLength() == 5);
    REQUIRE(err.input() == "short");
    REQUIRE_FALSE(err.position().has_value());
  }

  SECTION("Empty") {
    auto result = UUID::parse("");
    REQUIRE(result.isError());
    REQUIRE(result.error().actualLength() == 0);
  }

  SECTION("One too long") {
    auto result = UUID::parse("123e4567-e89b-12d3-a456-4266554400000");
    REQUIRE(result.isError());
    REQUIRE(result.error().actualLength() == 37);
  }

  SECTION("Without hyphens") {
    auto result = UUID::parse("123e4567e89b12d3a456426655440000");
    REQUIRE(result.isError());
    REQUIRE(result.error().code() == ErrorCode::InvalidLength);
  }
}

TEST_CASE("parse reports the misplaced separator", "[UUID][parse]") {
  const std::string input = "123e4567xe89b-12d3-a456-426655440000";
  auto result = UUID::parse(input);
  REQUIRE(result.isError());

  const auto& err = result.error();
  REQUIRE(err.code() == ErrorCode::InvalidFormat);
  REQUIRE(err.position() == std::size_t{8});
  REQUIRE(err.expectedChar() == '-');
  REQUIRE(err.actualChar() == 'x');
  REQUIRE(err.input() == input);
  REQUIRE(err.message().find("'x'") != std::string::npos);
}

TEST_CASE("parse checks every separator position", "[UUID][parse]") {
  const std::string valid = "123e4567-e89b-12d3-a456-426655440000";
  for (std::size_t pos : {8, 13, 18, 23}) {
    std::string input = valid;
    input[pos] = '_';
    auto result = UUID::parse(input);
    REQUIRE(result.isError());
    REQUIRE(result.error().position() == pos);
    REQUIRE(result.error().expectedChar() == '-');
    REQUIRE(result.error().actualChar() == '_');
  }
}

TEST_CASE("parse reports non-hex characters with their position", "[UUID][parse]") {
  SECTION("In the first group") {
    auto result = UUID::parse("123g4567-e89b-12d3-a456-426655440000");
    REQUIRE(result.isError());
    REQUIRE(result.error().code() == ErrorCode::InvalidFormat);
    REQUIRE(result.error().position() == std::size_t{3});
    REQUIRE(result.error().actualChar() == 'g');
    REQUIRE_FALSE(result.error().expectedChar().has_value());
  }

  SECTION("In the node") {
    auto result = UUID::parse("123e4567-e89b-12d3-a456-42665544000z");
    REQUIRE(result.isError());
    REQUIRE(result.error().position() == std::size_t{35});
  }

  SECTION("Leading sign") {
    auto result = UUID::parse("-23e4567-e89b-12d3-a456-426655440000");
    REQUIRE(result.isError());
    REQUIRE(result.error().position() == std::size_t{0});
  }

  SECTION("Hyphen inside a group") {
    auto result = UUID::parse("123e4567-e8-b-12d3-a456-426655440000");
    REQUIRE(result.isError());
    REQUIRE(result.error().position() == std::size_t{11});
  }
}

TEST_CASE("fromString falls back to nil", "[UUID][parse]") {
  REQUIRE(UUID::fromString("not a uuid").isNull());
  REQUIRE(UUID::fromString("123e4567-e89b-12d3-a456-426655440000") ==
          UUID::parse("123e4567-e89b-12d3-a456-426655440000").value());
}

TEST_CASE("isValid matches the canonical shape", "[UUID][isValid]") {
  REQUIRE(UUID::isValid("123e4567-e89b-12d3-a456-426655440000"));
  REQUIRE(UUID::isValid("123E4567-E89B-12D3-A456-426655440000"));
  REQUIRE(UUID::isValid("00000000-0000-0000-0000-000000000000"));

  REQUIRE_FALSE(UUID::isValid(""));
  REQUIRE_FALSE(UUID::isValid("short"));
  REQUIRE_FALSE(UUID::isValid("123e4567xe89b-12d3-a456-426655440000"));
  REQUIRE_FALSE(UUID::isValid("123e4567-e89b-12d3-a456-42665544000g"));
  REQUIRE_FALSE(UUID::isValid("123e4567-e89b-12d3-a456-4266554400000"));
  REQUIRE_FALSE(UUID::isValid("123e45678e89b-12d3-a456-42665544000-"));
  REQUIRE_FALSE(UUID::isValid("{23e4567-e89b-12d3-a456-426655440000"));
}

TEST_CASE("isValid implies parse succeeds", "[UUID][isValid]") {
  const std::vector<std::string> inputs = {
      "123e4567-e89b-12d3-a456-426655440000",
      "FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF",
      "123e4567xe89b-12d3-a456-426655440000",
      "123e4567-e89b-12d3-a456-42665544000",
      "1-3e4567-e89b-12d3-a456-426655440000",
      "123e4567-e89b-12d3-a456-4266554400 0",
      "c232ab00-9414-11ec-b3c8-9f6bdeced846",
  };
  for (const auto& input : inputs) {
    INFO(input);
    REQUIRE(UUID::isValid(input) == UUID::parse(input).ok());
  }
}
