// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for FTP command parsing and reply formatting

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using ftpcore::server::FtpCommand;
using ftpcore::server::FtpResponse;

TEST_CASE("FtpCommand parse splits at the first space", "[ftp_types][command]")
{
  auto cmd = FtpCommand::parse("stor my file.txt");
  REQUIRE(cmd.name == "STOR");
  REQUIRE(cmd.argument == "my file.txt");

  auto bare = FtpCommand::parse("Pwd");
  REQUIRE(bare.name == "PWD");
  REQUIRE(bare.argument.empty());

  auto empty = FtpCommand::parse("");
  REQUIRE(empty.name.empty());

  auto trailing = FtpCommand::parse("CWD ");
  REQUIRE(trailing.name == "CWD");
  REQUIRE(trailing.argument.empty());
}

TEST_CASE("FtpCommand toString masks passwords", "[ftp_types][command]")
{
  REQUIRE(FtpCommand::parse("PASS hunter2").toString() == "PASS ********");
  REQUIRE(FtpCommand::parse("USER anonymous").toString() == "USER anonymous");
  REQUIRE(FtpCommand::parse("NOOP").toString() == "NOOP");
}

TEST_CASE("FtpResponse wire format", "[ftp_types][response]")
{
  SECTION("single line")
  {
    FtpResponse r(220, "FTP Server Ready");
    REQUIRE(r.toWire() == "220 FTP Server Ready\r\n");
    REQUIRE(r.message() == "FTP Server Ready");
  }

  SECTION("no text")
  {
    FtpResponse r(200, std::vector<std::string>{});
    REQUIRE(r.toWire() == "200 \r\n");
    REQUIRE(r.message().empty());
  }

  SECTION("multi-line")
  {
    FtpResponse r(211, std::vector<std::string>{"Features:", "PASV", "UTF8", "End"});
    REQUIRE(r.toWire() == "211-Features:\r\n PASV\r\n UTF8\r\n211 End\r\n");
  }

  SECTION("two lines")
  {
    FtpResponse r(230, std::vector<std::string>{"Welcome", "Logged in"});
    REQUIRE(r.toWire() == "230-Welcome\r\n230 Logged in\r\n");
  }

  SECTION("invalid code")
  {
    REQUIRE_THROWS_AS(FtpResponse(99, "bad").toWire(), std::invalid_argument);
    REQUIRE_THROWS_AS(FtpResponse(1000, "bad").toWire(), std::invalid_argument);
    REQUIRE_THROWS_AS(FtpResponse().toWire(), std::invalid_argument);
  }
}
