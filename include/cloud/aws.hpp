#pragma once
#include "cloud/provider.hpp"
#include "inventory/raw_record.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/ec2/EC2Client.h>
#include <aws/ec2/EC2Errors.h>
#include <aws/ec2/model/Instance.h>
#include <aws/ec2/model/InstanceNetworkInterface.h>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory {
namespace cloud {
//---------------------------------------------------------------------------
/// Initializes the AWS SDK for the lifetime of the guard, one per process
class AWSSDKGuard {
    /// The sdk options
    Aws::SDKOptions _options;

    public:
    /// The constructor
    AWSSDKGuard() { Aws::InitAPI(_options); }
    /// The destructor
    ~AWSSDKGuard() { Aws::ShutdownAPI(_options); }
    /// No copies
    AWSSDKGuard(const AWSSDKGuard&) = delete;
    /// No copies
    AWSSDKGuard& operator=(const AWSSDKGuard&) = delete;
};
//---------------------------------------------------------------------------
/// Implements the EC2 instance listing of one region
class AWSRegionClient : public RegionClient {
    /// The region
    std::string _region;
    /// The EC2 client
    std::unique_ptr<Aws::EC2::EC2Client> _client;

    public:
    /// The constructor
    AWSRegionClient(std::string region, const Aws::Client::ClientConfiguration& config);
    /// Get the region
    [[nodiscard]] const std::string& getRegion() const override { return _region; }
    /// Issues one DescribeInstances request. Access and connection failures raise RegionAccessError, other failures std::runtime_error.
    [[nodiscard]] DescribeInstancesPage describeInstances(const std::optional<std::string>& nextToken) override;

    /// Does the error mean that the region cannot be reached with the current credentials?
    [[nodiscard]] static bool isAccessError(Aws::EC2::EC2Errors type, std::string_view exceptionName);
};
//---------------------------------------------------------------------------
/// Implements the AWS EC2 logic
class AWS : public Provider {
    public:
    /// The settings for AWS requests
    struct Settings {
        /// The custom endpoint
        std::string endpoint;
        /// Use https?
        bool https = true;
        /// The connect timeout in ms
        long connectTimeoutMs = 1000;
        /// The request timeout in ms
        long requestTimeoutMs = 3000;
    };

    /// The commercial regions that are listed by default
    static constexpr std::string_view defaultRegions[] = {
        "us-east-2", "us-east-1", "us-west-1", "us-west-2", "af-south-1", "ap-east-1", "ap-south-1",
        "ap-northeast-3", "ap-northeast-2", "ap-southeast-1", "ap-southeast-2", "ap-northeast-1",
        "ca-central-1", "eu-central-1", "eu-west-1", "eu-west-2", "eu-south-1", "eu-west-3",
        "eu-north-1", "me-south-1", "sa-east-1"};

    protected:
    /// The settings
    Settings _settings;

    public:
    /// The constructor
    explicit AWS(Settings settings) : _settings(std::move(settings)) {}

    /// Creates the EC2 client of the region
    [[nodiscard]] std::unique_ptr<RegionClient> makeClient(const std::string& region) override;
    /// Get the default regions
    [[nodiscard]] std::vector<std::string> getDefaultRegions() const override;
    /// Builds the sdk client configuration of a region
    [[nodiscard]] Aws::Client::ClientConfiguration buildConfiguration(const std::string& region) const;
    /// Get the settings
    [[nodiscard]] const Settings& getSettings() const { return _settings; }

    /// Translates the sdk instance model, only members that were set in the response are copied
    [[nodiscard]] static inventory::RawInstance toRawInstance(const Aws::EC2::Model::Instance& instance);
    /// Translates the sdk interface model
    [[nodiscard]] static inventory::RawNetworkInterface toRawNetworkInterface(const Aws::EC2::Model::InstanceNetworkInterface& networkInterface);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace ec2inventory
