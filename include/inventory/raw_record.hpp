#pragma once
#include "inventory/instance.hpp"
#include <chrono>
#include <optional>
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
namespace ec2inventory::inventory {
//---------------------------------------------------------------------------
// The records as delivered by a provider. Every member maps to one provider key,
// an unset member means the key was missing in the response.
//---------------------------------------------------------------------------
/// The public address association of an interface (key Association)
struct RawAssociation {
    /// IpOwnerId
    std::optional<std::string> ipOwnerId;
    /// PublicDnsName
    std::optional<std::string> publicDnsName;
    /// PublicIp
    std::optional<std::string> publicIp;
};
//---------------------------------------------------------------------------
/// A network interface record
struct RawNetworkInterface {
    /// Association
    std::optional<RawAssociation> association;
    /// MacAddress
    std::optional<std::string> macAddress;
    /// NetworkInterfaceId
    std::optional<std::string> networkInterfaceId;
    /// OwnerId
    std::optional<std::string> ownerId;
    /// PrivateDnsName
    std::optional<std::string> privateDnsName;
    /// SubnetId
    std::optional<std::string> subnetId;
    /// Status
    std::optional<std::string> status;
    /// Ipv6Addresses
    std::optional<std::string> ipv6Addresses;
    /// PrivateIpAddress
    std::optional<std::string> privateIpAddress;
};
//---------------------------------------------------------------------------
/// An instance record
struct RawInstance {
    /// ImageId
    std::optional<std::string> imageId;
    /// InstanceId
    std::optional<std::string> instanceId;
    /// NetworkInterfaces
    std::optional<std::vector<RawNetworkInterface>> networkInterfaces;
    /// State
    std::optional<InstanceState> state;
    /// LaunchTime
    std::optional<std::chrono::system_clock::time_point> launchTime;
    /// Tags
    std::optional<std::vector<Tag>> tags;
    /// CpuOptions
    std::optional<CpuOptions> cpuOptions;
    /// InstanceType
    std::optional<std::string> instanceType;
    /// SecurityGroups
    std::optional<std::vector<SecurityGroup>> securityGroups;
    /// ClientToken
    std::optional<std::string> clientToken;
    /// StateTransitionReason
    std::optional<std::string> stateTransitionReason;
    /// RootDeviceName
    std::optional<std::string> rootDeviceName;
    /// RamdiskId
    std::optional<std::string> ramdiskId;
    /// PlatformDetails
    std::optional<std::string> platformDetails;
    /// KernelId
    std::optional<std::string> kernelId;
    /// HostId
    std::optional<std::string> hostId;
};
//---------------------------------------------------------------------------
/// A reservation grouping of one listing page
struct RawReservation {
    /// The instances of the reservation
    std::vector<RawInstance> instances;
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
