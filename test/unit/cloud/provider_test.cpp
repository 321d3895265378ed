#include "cloud/provider.hpp"
#include <catch2/catch.hpp>
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
namespace ec2inventory::cloud::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("provider_region_list") {
    REQUIRE(Provider::parseRegionList("us-east-1") == vector<string>{"us-east-1"});
    REQUIRE(Provider::parseRegionList("us-east-1,eu-west-1") == vector<string>{"us-east-1", "eu-west-1"});
    REQUIRE(Provider::parseRegionList(" us-east-1 , eu-west-1,") == vector<string>{"us-east-1", "eu-west-1"});
    REQUIRE(Provider::parseRegionList(",,ap-south-1,,") == vector<string>{"ap-south-1"});
    // Duplicates are listed twice
    REQUIRE(Provider::parseRegionList("sa-east-1,sa-east-1") == vector<string>{"sa-east-1", "sa-east-1"});
    REQUIRE(Provider::parseRegionList("").empty());
    REQUIRE(Provider::parseRegionList(" , ").empty());
}
//---------------------------------------------------------------------------
TEST_CASE("provider_region_access_error") {
    RegionAccessError error("eu-south-1", "OptInRequired", "You are not subscribed to this service.");
    REQUIRE(error.getRegion() == "eu-south-1");
    REQUIRE(error.getCode() == "OptInRequired");
    REQUIRE(string(error.what()) == "Could not access region eu-south-1 (OptInRequired): You are not subscribed to this service.");
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::cloud::test
