#pragma once
#include "utils/ip_address.hpp"
#include <optional>
#include <string>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory::inventory {
//---------------------------------------------------------------------------
/// A virtual network interface attached to an instance
struct NetworkInterface {
    /// The owner of the public address association
    std::string ipOwnerId;
    /// The public DNS name
    std::string publicDnsName;
    /// The MAC address
    std::string macAddress;
    /// The interface id
    std::string networkInterfaceId;
    /// The account that owns the interface
    std::string ownerId;
    /// The private DNS name
    std::string privateDnsName;
    /// The subnet id
    std::string subnetId;
    /// The attachment status (e.g. in-use)
    std::string status;
    /// The public address, if associated and valid
    std::optional<utils::IpAddress> publicIpAddress;
    /// The IPv6 address, if assigned and valid
    std::optional<utils::IpAddress> ipv6Address;
    /// The primary private address, if valid
    std::optional<utils::IpAddress> privateIpAddress;
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
