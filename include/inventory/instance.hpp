#pragma once
#include "inventory/network_interface.hpp"
#include <chrono>
#include <cstdint>
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
/// The lifecycle state of an instance
struct InstanceState {
    /// The numeric state code (e.g. 16 for running)
    int32_t code = 0;
    /// The state name (e.g. running)
    std::string name;

    bool operator==(const InstanceState&) const = default;
};
//---------------------------------------------------------------------------
/// A user defined tag
struct Tag {
    /// The key
    std::string key;
    /// The value
    std::string value;

    bool operator==(const Tag&) const = default;
};
//---------------------------------------------------------------------------
/// The cpu layout
struct CpuOptions {
    /// Number of cores
    int32_t coreCount = 0;
    /// Threads per core
    int32_t threadsPerCore = 0;

    bool operator==(const CpuOptions&) const = default;
};
//---------------------------------------------------------------------------
/// A security group reference
struct SecurityGroup {
    /// The group name
    std::string groupName;
    /// The group id
    std::string groupId;

    bool operator==(const SecurityGroup&) const = default;
};
//---------------------------------------------------------------------------
/// One virtual machine instance
/// The optional provider fields (ram disk, platform, kernel, host) stay plain strings that are empty if the provider did not report them
struct Instance {
    /// The id of the image used to launch the instance
    std::string imageId;
    /// The id of the instance
    std::string instanceId;
    /// The network interfaces
    std::vector<NetworkInterface> networkInterfaces;
    /// The current state
    InstanceState state;
    /// The launch time
    std::chrono::system_clock::time_point launchTime;
    /// The tags in the order reported by the provider
    std::vector<Tag> tags;
    /// The cpu layout
    CpuOptions cpuDetails;
    /// The instance type (e.g. t2.micro)
    std::string instanceType;
    /// The security groups
    std::vector<SecurityGroup> securityGroups;
    /// The idempotency token of the launch request
    std::string clientToken;
    /// The reason of the last state transition, may be empty
    std::string stateTransitionReason;
    /// The root device name (e.g. /dev/sda1)
    std::string rootDeviceName;
    /// The ram disk id
    std::string ramDiskId;
    /// The platform details (e.g. Linux/UNIX)
    std::string platform;
    /// The kernel id
    std::string kernelId;
    /// The id of the dedicated host
    std::string hostId;
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
