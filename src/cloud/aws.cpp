#include "cloud/aws.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <aws/core/http/Scheme.h>
#include <aws/ec2/model/DescribeInstancesRequest.h>
#include <aws/ec2/model/DescribeInstancesResponse.h>
#include <aws/ec2/model/InstanceStateName.h>
#include <aws/ec2/model/InstanceType.h>
#include <aws/ec2/model/NetworkInterfaceStatus.h>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory::cloud {
//---------------------------------------------------------------------------
using namespace std;
namespace model = Aws::EC2::Model;
//---------------------------------------------------------------------------
static string toString(const Aws::String& value)
// Copies an sdk string
{
    return string(value.c_str(), value.size());
}
//---------------------------------------------------------------------------
AWSRegionClient::AWSRegionClient(string region, const Aws::Client::ClientConfiguration& config)
    : _region(move(region)), _client(make_unique<Aws::EC2::EC2Client>(config))
// The constructor
{
}
//---------------------------------------------------------------------------
DescribeInstancesPage AWSRegionClient::describeInstances(const optional<string>& nextToken)
// Requests one page of the instance listing
{
    model::DescribeInstancesRequest request;
    if (nextToken)
        request.SetNextToken(Aws::String(nextToken->c_str(), nextToken->size()));

    auto outcome = _client->DescribeInstances(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        auto code = toString(error.GetExceptionName());
        // Malformed requests, throttling and service faults are not a property of the region
        if (!isAccessError(error.GetErrorType(), code))
            throw runtime_error("DescribeInstances failed in region " + _region + " (" + code + "): " + toString(error.GetMessage()));
        if (code.empty())
            code = "NetworkError";
        throw RegionAccessError(_region, move(code), toString(error.GetMessage()));
    }

    const auto& result = outcome.GetResult();
    DescribeInstancesPage page;
    page.reservations.reserve(result.GetReservations().size());
    for (const auto& reservation : result.GetReservations()) {
        inventory::RawReservation rawReservation;
        rawReservation.instances.reserve(reservation.GetInstances().size());
        for (const auto& instance : reservation.GetInstances())
            rawReservation.instances.push_back(AWS::toRawInstance(instance));
        page.reservations.push_back(move(rawReservation));
    }
    if (!result.GetNextToken().empty())
        page.nextToken = toString(result.GetNextToken());
    return page;
}
//---------------------------------------------------------------------------
bool AWSRegionClient::isAccessError(Aws::EC2::EC2Errors type, string_view exceptionName)
// Classifies the error of a failed outcome
{
    using Aws::EC2::EC2Errors;
    switch (type) {
        case EC2Errors::ACCESS_DENIED:
        case EC2Errors::UNRECOGNIZED_CLIENT:
        case EC2Errors::INVALID_CLIENT_TOKEN_ID:
        case EC2Errors::INVALID_ACCESS_KEY_ID:
        case EC2Errors::MISSING_AUTHENTICATION_TOKEN:
        case EC2Errors::SIGNATURE_DOES_NOT_MATCH:
        case EC2Errors::OPT_IN_REQUIRED:
        case EC2Errors::NETWORK_CONNECTION:
            return true;
        default:
            break;
    }
    // EC2 specific codes without a core error type
    return exceptionName == "AuthFailure" || exceptionName == "UnauthorizedOperation" || exceptionName == "OptInRequired";
}
//---------------------------------------------------------------------------
Aws::Client::ClientConfiguration AWS::buildConfiguration(const string& region) const
// Builds the client configuration
{
    Aws::Client::ClientConfiguration config;
    config.region = Aws::String(region.c_str(), region.size());
    config.scheme = _settings.https ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    config.connectTimeoutMs = _settings.connectTimeoutMs;
    config.requestTimeoutMs = _settings.requestTimeoutMs;
    if (!_settings.endpoint.empty())
        config.endpointOverride = Aws::String(_settings.endpoint.c_str(), _settings.endpoint.size());
    return config;
}
//---------------------------------------------------------------------------
unique_ptr<RegionClient> AWS::makeClient(const string& region)
// Creates the EC2 client of the region
{
    if (region.empty())
        throw RegionAccessError(region, "InvalidRegion", "empty region name");
    return make_unique<AWSRegionClient>(region, buildConfiguration(region));
}
//---------------------------------------------------------------------------
vector<string> AWS::getDefaultRegions() const
// Get the default regions
{
    vector<string> regions;
    for (auto region : defaultRegions)
        regions.emplace_back(region);
    return regions;
}
//---------------------------------------------------------------------------
inventory::RawNetworkInterface AWS::toRawNetworkInterface(const model::InstanceNetworkInterface& networkInterface)
// Translates an interface
{
    inventory::RawNetworkInterface raw;
    if (networkInterface.AssociationHasBeenSet()) {
        const auto& association = networkInterface.GetAssociation();
        inventory::RawAssociation rawAssociation;
        if (association.IpOwnerIdHasBeenSet())
            rawAssociation.ipOwnerId = toString(association.GetIpOwnerId());
        if (association.PublicDnsNameHasBeenSet())
            rawAssociation.publicDnsName = toString(association.GetPublicDnsName());
        if (association.PublicIpHasBeenSet())
            rawAssociation.publicIp = toString(association.GetPublicIp());
        raw.association = move(rawAssociation);
    }
    if (networkInterface.MacAddressHasBeenSet())
        raw.macAddress = toString(networkInterface.GetMacAddress());
    if (networkInterface.NetworkInterfaceIdHasBeenSet())
        raw.networkInterfaceId = toString(networkInterface.GetNetworkInterfaceId());
    if (networkInterface.OwnerIdHasBeenSet())
        raw.ownerId = toString(networkInterface.GetOwnerId());
    if (networkInterface.PrivateDnsNameHasBeenSet())
        raw.privateDnsName = toString(networkInterface.GetPrivateDnsName());
    if (networkInterface.SubnetIdHasBeenSet())
        raw.subnetId = toString(networkInterface.GetSubnetId());
    if (networkInterface.StatusHasBeenSet())
        raw.status = toString(model::NetworkInterfaceStatusMapper::GetNameForNetworkInterfaceStatus(networkInterface.GetStatus()));
    // Only the first IPv6 address is kept
    if (!networkInterface.GetIpv6Addresses().empty())
        raw.ipv6Addresses = toString(networkInterface.GetIpv6Addresses().front().GetIpv6Address());
    if (networkInterface.PrivateIpAddressHasBeenSet())
        raw.privateIpAddress = toString(networkInterface.GetPrivateIpAddress());
    return raw;
}
//---------------------------------------------------------------------------
inventory::RawInstance AWS::toRawInstance(const model::Instance& instance)
// Translates an instance
{
    inventory::RawInstance raw;
    if (instance.ImageIdHasBeenSet())
        raw.imageId = toString(instance.GetImageId());
    if (instance.InstanceIdHasBeenSet())
        raw.instanceId = toString(instance.GetInstanceId());
    if (instance.StateHasBeenSet()) {
        const auto& state = instance.GetState();
        raw.state = inventory::InstanceState{state.GetCode(), toString(model::InstanceStateNameMapper::GetNameForInstanceStateName(state.GetName()))};
    }
    if (instance.LaunchTimeHasBeenSet())
        raw.launchTime = instance.GetLaunchTime().UnderlyingTimestamp();
    if (instance.CpuOptionsHasBeenSet())
        raw.cpuOptions = inventory::CpuOptions{instance.GetCpuOptions().GetCoreCount(), instance.GetCpuOptions().GetThreadsPerCore()};
    if (instance.InstanceTypeHasBeenSet())
        raw.instanceType = toString(model::InstanceTypeMapper::GetNameForInstanceType(instance.GetInstanceType()));
    if (instance.ClientTokenHasBeenSet())
        raw.clientToken = toString(instance.GetClientToken());
    if (instance.StateTransitionReasonHasBeenSet())
        raw.stateTransitionReason = toString(instance.GetStateTransitionReason());
    if (instance.RootDeviceNameHasBeenSet())
        raw.rootDeviceName = toString(instance.GetRootDeviceName());
    if (instance.RamdiskIdHasBeenSet())
        raw.ramdiskId = toString(instance.GetRamdiskId());
    if (instance.PlatformDetailsHasBeenSet())
        raw.platformDetails = toString(instance.GetPlatformDetails());
    if (instance.KernelIdHasBeenSet())
        raw.kernelId = toString(instance.GetKernelId());
    if (instance.PlacementHasBeenSet() && instance.GetPlacement().HostIdHasBeenSet())
        raw.hostId = toString(instance.GetPlacement().GetHostId());

    // The query protocol omits empty lists, so the lists are always present
    raw.networkInterfaces.emplace();
    for (const auto& networkInterface : instance.GetNetworkInterfaces())
        raw.networkInterfaces->push_back(toRawNetworkInterface(networkInterface));
    raw.tags.emplace();
    for (const auto& tag : instance.GetTags())
        raw.tags->push_back(inventory::Tag{toString(tag.GetKey()), toString(tag.GetValue())});
    raw.securityGroups.emplace();
    for (const auto& group : instance.GetSecurityGroups())
        raw.securityGroups->push_back(inventory::SecurityGroup{toString(group.GetGroupName()), toString(group.GetGroupId())});
    return raw;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::cloud
