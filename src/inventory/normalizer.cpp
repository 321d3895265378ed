#include "inventory/normalizer.hpp"
#include "inventory/errors.hpp"
#include "utils/log.hpp"
#include <utility>
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
using namespace std;
//---------------------------------------------------------------------------
template <typename T>
static const T& require(const optional<T>& value, const char* key, string_view instanceId, string_view networkInterfaceId = "")
// Checked access to a required key
{
    if (!value)
        throw MissingFieldError(key, string(instanceId), string(networkInterfaceId));
    return *value;
}
//---------------------------------------------------------------------------
optional<utils::IpAddress> Normalizer::parseAddress(const optional<string>& value, string_view field, string_view interfaceId) const
// Parses the address if one is set
{
    if (!value || value->empty())
        return nullopt;
    try {
        return utils::IpAddress::parse(*value);
    } catch (const utils::AddressParseError&) {
        string message = string(field) + " address '" + *value + "' is not valid in network interface with the id " + string(interfaceId);
        _log.error(message);
    }
    return nullopt;
}
//---------------------------------------------------------------------------
NetworkInterface Normalizer::toNetworkInterface(const RawNetworkInterface& raw, string_view instanceId) const
// Builds the typed interface
{
    NetworkInterface result;
    // The id is read first so that later errors can name the interface
    result.networkInterfaceId = require(raw.networkInterfaceId, "NetworkInterfaceId", instanceId);
    const auto& id = result.networkInterfaceId;
    const auto& association = require(raw.association, "Association", instanceId, id);
    result.ipOwnerId = require(association.ipOwnerId, "Association.IpOwnerId", instanceId, id);
    result.publicDnsName = require(association.publicDnsName, "Association.PublicDnsName", instanceId, id);
    result.macAddress = require(raw.macAddress, "MacAddress", instanceId, id);
    result.ownerId = require(raw.ownerId, "OwnerId", instanceId, id);
    result.privateDnsName = require(raw.privateDnsName, "PrivateDnsName", instanceId, id);
    result.subnetId = require(raw.subnetId, "SubnetId", instanceId, id);
    result.status = require(raw.status, "Status", instanceId, id);

    // The addresses are optional, an invalid value is reported and skipped
    result.ipv6Address = parseAddress(raw.ipv6Addresses, "Ipv6Addresses", id);
    result.publicIpAddress = parseAddress(association.publicIp, "Association.PublicIp", id);
    result.privateIpAddress = parseAddress(raw.privateIpAddress, "PrivateIpAddress", id);
    return result;
}
//---------------------------------------------------------------------------
Instance Normalizer::toInstance(const RawInstance& raw) const
// Builds the typed instance
{
    Instance result;
    result.instanceId = require(raw.instanceId, "InstanceId", "");
    const auto& id = result.instanceId;
    result.imageId = require(raw.imageId, "ImageId", id);

    const auto& interfaces = require(raw.networkInterfaces, "NetworkInterfaces", id);
    result.networkInterfaces.reserve(interfaces.size());
    for (const auto& rawInterface : interfaces)
        result.networkInterfaces.push_back(toNetworkInterface(rawInterface, id));

    result.state = require(raw.state, "State", id);
    result.launchTime = require(raw.launchTime, "LaunchTime", id);
    result.tags = require(raw.tags, "Tags", id);
    result.cpuDetails = require(raw.cpuOptions, "CpuOptions", id);
    result.instanceType = require(raw.instanceType, "InstanceType", id);
    result.securityGroups = require(raw.securityGroups, "SecurityGroups", id);
    result.clientToken = require(raw.clientToken, "ClientToken", id);
    result.stateTransitionReason = require(raw.stateTransitionReason, "StateTransitionReason", id);
    result.rootDeviceName = require(raw.rootDeviceName, "RootDeviceName", id);

    // Only these four keys are optional, they stay empty if missing
    if (raw.ramdiskId)
        result.ramDiskId = *raw.ramdiskId;
    if (raw.platformDetails)
        result.platform = *raw.platformDetails;
    if (raw.kernelId)
        result.kernelId = *raw.kernelId;
    if (raw.hostId)
        result.hostId = *raw.hostId;
    return result;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
