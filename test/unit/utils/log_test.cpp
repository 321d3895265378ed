#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("log_levels") {
    REQUIRE(Log::getLevelName(Log::Level::Debug) == "DEBUG");
    REQUIRE(Log::getLevelName(Log::Level::Info) == "INFO");
    REQUIRE(Log::getLevelName(Log::Level::Error) == "ERROR");
    REQUIRE(Log::parseLevel("debug") == Log::Level::Debug);
    REQUIRE(Log::parseLevel("INFO") == Log::Level::Info);
    REQUIRE(Log::parseLevel("error") == Log::Level::Error);
    REQUIRE_THROWS_AS(Log::parseLevel("verbose"), invalid_argument);
}
//---------------------------------------------------------------------------
TEST_CASE("stream_log") {
    stringstream stream;
    StreamLog log(stream, Log::Level::Info);
    log.debug("hidden");
    log.info("phase started");
    log.error("region failed");

    string first, second, rest;
    getline(stream, first);
    getline(stream, second);
    getline(stream, rest);
    REQUIRE(first.find(" INFO phase started") != string::npos);
    REQUIRE(second.find(" ERROR region failed") != string::npos);
    REQUIRE(rest.empty());
    REQUIRE(stream.str().find("hidden") == string::npos);
    // Lines start with the timestamp
    REQUIRE(first.size() > 20);
    REQUIRE(first[4] == '-');
    REQUIRE(first[19] == 'Z');
}
//---------------------------------------------------------------------------
TEST_CASE("memory_log") {
    MemoryLog log;
    log.debug("pulled 2 instances from region us-east-1");
    log.error("Could not pull instances from region eu-west-1");
    log.error("second");
    REQUIRE(log.getEntries().size() == 3);
    REQUIRE(log.getEntries()[0].level == Log::Level::Debug);
    REQUIRE(log.count(Log::Level::Error) == 2);
    REQUIRE(log.count(Log::Level::Info) == 0);
    REQUIRE(log.contains(Log::Level::Error, "eu-west-1"));
    REQUIRE(!log.contains(Log::Level::Debug, "eu-west-1"));
    log.clear();
    REQUIRE(log.getEntries().empty());
}
//---------------------------------------------------------------------------
TEST_CASE("utils") {
    REQUIRE(formatTimestamp(chrono::system_clock::time_point{}) == "1970-01-01T00:00:00Z");
    REQUIRE(formatTimestamp(chrono::system_clock::time_point{chrono::seconds(1614600000)}) == "2021-03-01T12:00:00Z");
    REQUIRE(trim("  us-east-1\t") == "us-east-1");
    REQUIRE(trim("us-east-1") == "us-east-1");
    REQUIRE(trim(" \t ").empty());
    REQUIRE(trim("").empty());
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils::test
