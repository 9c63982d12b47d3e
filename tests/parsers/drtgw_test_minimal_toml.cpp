// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

namespace toml = drtgw::parsers::toml;

TEST_CASE("TOML scalars and sections", "[toml]")
{
  auto tbl = toml::parse(R"(
# top level comment
title = "gateway"   # trailing comment
literal = 'C:\path'
escaped = "line\n\"quoted\""
count = 1_000
negative = -42
ratio = 1.5e2
enabled = false

[gateway]
base_url = "http://localhost:8085"
retry.max_attempts = 4

[gateway."weird key"]
ok = true
)");

  REQUIRE(tbl.at_path("title").as<std::string>() == "gateway");
  REQUIRE(tbl.at_path("literal").as<std::string>() == "C:\\path");
  REQUIRE(tbl.at_path("escaped").as<std::string>() == "line\n\"quoted\"");
  REQUIRE(tbl.at_path("count").as<int64_t>() == 1000);
  REQUIRE(tbl.at_path("negative").as<int64_t>() == -42);
  REQUIRE(tbl.at_path("ratio").as<double>().value() == Approx(150.0));
  REQUIRE(tbl.at_path("enabled").as<bool>() == false);
  REQUIRE(tbl.at_path("gateway.base_url").as<std::string>() == "http://localhost:8085");
  REQUIRE(tbl.at_path("gateway.retry.max_attempts").as<int64_t>() == 4);
  REQUIRE(tbl.at_path("gateway").is_table());
  REQUIRE_FALSE(tbl.at_path("gateway.missing"));
  REQUIRE_FALSE(tbl.at_path("title.deeper"));
}

TEST_CASE("TOML arrays and inline tables", "[toml]")
{
  auto tbl = toml::parse("hosts = [\n  \"a\",\n  \"b\",\n]\n"
                         "point = { x = 1, y = 2 }\n"
                         "empty = []\n");

  const toml::array *hosts = tbl.at_path("hosts").as_array();
  REQUIRE(hosts != nullptr);
  REQUIRE(hosts->size() == 2);
  REQUIRE((*hosts)[1].as<std::string>() == "b");
  REQUIRE(tbl.at_path("point.y").as<int64_t>() == 2);
  REQUIRE(tbl.at_path("empty").as_array()->empty());
}

TEST_CASE("TOML errors carry the line number", "[toml][error]")
{
  SECTION("Duplicate key")
  {
    try
    {
      toml::parse("a = 1\nb = 2\na = 3\n");
      FAIL("expected parse_error");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 3);
      REQUIRE(std::string(e.what()).find("duplicate key") != std::string::npos);
    }
  }

  SECTION("Malformed input")
  {
    REQUIRE_THROWS_AS(toml::parse("[unterminated\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("s = \"open\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("n = 12abc\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("b = yes\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("[[servers]]\nname = \"x\"\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("big = 99999999999999999999\n"), toml::parse_error);
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(toml::parse_file("no_such_file.toml"), std::runtime_error);
  }
}
