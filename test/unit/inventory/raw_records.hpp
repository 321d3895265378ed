#pragma once
#include "inventory/raw_record.hpp"
#include <chrono>
#include <string>
#include <utility>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory::inventory::test {
//---------------------------------------------------------------------------
/// The launch time of the sample records
inline const std::chrono::system_clock::time_point sampleLaunchTime{std::chrono::seconds(1614600000)};
//---------------------------------------------------------------------------
/// An interface record with every key set
inline RawNetworkInterface makeRawNetworkInterface(std::string networkInterfaceId = "eni-1") {
    RawNetworkInterface raw;
    raw.association = RawAssociation{"o", "", "198.51.100.5"};
    raw.macAddress = "00:00";
    raw.networkInterfaceId = std::move(networkInterfaceId);
    raw.ownerId = "o";
    raw.privateDnsName = "";
    raw.subnetId = "s-1";
    raw.status = "in-use";
    raw.ipv6Addresses = "";
    raw.privateIpAddress = "10.0.0.5";
    return raw;
}
//---------------------------------------------------------------------------
/// An instance record with every required key set and one interface
inline RawInstance makeRawInstance(std::string instanceId = "i-1") {
    RawInstance raw;
    raw.imageId = "ami-1";
    raw.instanceId = std::move(instanceId);
    raw.networkInterfaces = std::vector<RawNetworkInterface>{makeRawNetworkInterface()};
    raw.state = InstanceState{16, "running"};
    raw.launchTime = sampleLaunchTime;
    raw.tags = std::vector<Tag>{};
    raw.cpuOptions = CpuOptions{1, 2};
    raw.instanceType = "t2.micro";
    raw.securityGroups = std::vector<SecurityGroup>{};
    raw.clientToken = "";
    raw.stateTransitionReason = "";
    raw.rootDeviceName = "/dev/sda1";
    return raw;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory::test
