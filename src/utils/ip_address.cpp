#include "utils/ip_address.hpp"
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
IpAddress IpAddress::parse(string_view address)
// Parses the address with inet_pton
{
    // inet_pton stops at the first NUL, so embedded ones would truncate the input
    if (address.empty() || address.find('\0') != string_view::npos)
        throw AddressParseError(address);

    string terminated(address);
    IpAddress result;
    if (inet_pton(AF_INET, terminated.c_str(), result._bytes.data()) == 1) {
        result._family = Family::IPv4;
        return result;
    }
    if (inet_pton(AF_INET6, terminated.c_str(), result._bytes.data()) == 1) {
        result._family = Family::IPv6;
        return result;
    }
    throw AddressParseError(address);
}
//---------------------------------------------------------------------------
string IpAddress::toString() const
// Prints the address with inet_ntop
{
    char buffer[INET6_ADDRSTRLEN];
    auto family = isV4() ? AF_INET : AF_INET6;
    if (!inet_ntop(family, _bytes.data(), buffer, sizeof(buffer)))
        throw runtime_error("Could not print IP address");
    return string(buffer);
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils
