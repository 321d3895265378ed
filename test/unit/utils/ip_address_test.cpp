#include "utils/ip_address.hpp"
#include <catch2/catch.hpp>
#include <string_view>
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
TEST_CASE("ip_address_v4") {
    auto address = IpAddress::parse("198.51.100.5");
    REQUIRE(address.isV4());
    REQUIRE(address.getFamily() == IpAddress::Family::IPv4);
    REQUIRE(address.getBytes()[0] == 198);
    REQUIRE(address.getBytes()[1] == 51);
    REQUIRE(address.getBytes()[2] == 100);
    REQUIRE(address.getBytes()[3] == 5);
    REQUIRE(address.toString() == "198.51.100.5");
    REQUIRE(IpAddress::parse("0.0.0.0").toString() == "0.0.0.0");
    REQUIRE(IpAddress::parse("255.255.255.255").toString() == "255.255.255.255");
}
//---------------------------------------------------------------------------
TEST_CASE("ip_address_v6") {
    auto address = IpAddress::parse("2001:db8::1");
    REQUIRE(address.isV6());
    REQUIRE(address.getBytes()[0] == 0x20);
    REQUIRE(address.getBytes()[1] == 0x01);
    REQUIRE(address.getBytes()[15] == 0x01);
    REQUIRE(address.toString() == "2001:db8::1");
    // Canonical form compresses zeros and uses lower case
    REQUIRE(IpAddress::parse("2001:0DB8:0000:0000:0000:0000:0000:0001").toString() == "2001:db8::1");
    REQUIRE(IpAddress::parse("::").toString() == "::");
    REQUIRE(IpAddress::parse("::ffff:10.0.0.1").isV6());
}
//---------------------------------------------------------------------------
TEST_CASE("ip_address_invalid") {
    REQUIRE_THROWS_AS(IpAddress::parse(""), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse("not-an-ip"), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse("256.1.1.1"), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse("1.2.3"), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse("1.2.3.4.5"), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse(" 10.0.0.1"), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse("2001:db8::1::2"), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse("fe80::1%eth0"), AddressParseError);
    REQUIRE_THROWS_WITH(IpAddress::parse("x.y"), "Invalid IP address: 'x.y'");
    // Embedded NUL bytes do not cut the input short
    REQUIRE_THROWS_AS(IpAddress::parse(std::string_view("198.51.100.5\0junk", 17)), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse(std::string_view("2001:db8::1\0", 12)), AddressParseError);
    REQUIRE_THROWS_AS(IpAddress::parse(std::string_view("\0", 1)), AddressParseError);
}
//---------------------------------------------------------------------------
TEST_CASE("ip_address_compare") {
    REQUIRE(IpAddress::parse("10.0.0.5") == IpAddress::parse("10.0.0.5"));
    REQUIRE(IpAddress::parse("10.0.0.5") != IpAddress::parse("10.0.0.6"));
    REQUIRE(IpAddress::parse("2001:db8::1") == IpAddress::parse("2001:db8:0::1"));
    // The mapped IPv6 form is a different address than the plain IPv4 one
    REQUIRE(IpAddress::parse("::ffff:10.0.0.5") != IpAddress::parse("10.0.0.5"));
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils::test
