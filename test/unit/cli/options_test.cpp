#include "cli/options.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory::cli::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
/// Parses the arguments behind the program name
static Options parseArguments(vector<const char*> arguments) {
    arguments.insert(arguments.begin(), "EC2Inventory");
    return Options::parse(static_cast<int>(arguments.size()), arguments.data());
}
//---------------------------------------------------------------------------
TEST_CASE("options_defaults") {
    auto options = parseArguments({});
    REQUIRE(options.regions.empty());
    REQUIRE(options.endpoint.empty());
    REQUIRE(options.https);
    REQUIRE(options.logLevel == utils::Log::Level::Debug);
    REQUIRE(!options.help);
}
//---------------------------------------------------------------------------
TEST_CASE("options_values") {
    auto options = parseArguments({"-r", "us-east-1, eu-west-1", "-e", "localhost:4566", "-s", "0", "-l", "error"});
    REQUIRE(options.regions == vector<string>{"us-east-1", "eu-west-1"});
    REQUIRE(options.endpoint == "localhost:4566");
    REQUIRE(!options.https);
    REQUIRE(options.logLevel == utils::Log::Level::Error);
    REQUIRE(!options.help);
}
//---------------------------------------------------------------------------
TEST_CASE("options_help") {
    REQUIRE(parseArguments({"-h"}).help);
    REQUIRE(parseArguments({"--help"}).help);
    // Help wins over the remaining arguments
    REQUIRE(parseArguments({"-r", "us-east-1", "-h", "-x"}).help);
    // -h no longer takes the https switch
    REQUIRE(parseArguments({"-h", "0"}).help);
    REQUIRE(string(Options::getHelpText()).find("-s https") != string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("options_invalid") {
    REQUIRE_THROWS_AS(parseArguments({"-x", "1"}), invalid_argument);
    REQUIRE_THROWS_AS(parseArguments({"-r"}), invalid_argument);
    REQUIRE_THROWS_AS(parseArguments({"-l", "verbose"}), invalid_argument);
    REQUIRE_THROWS_WITH(parseArguments({"-e"}), "Missing value for option -e");
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::cli::test
