#pragma once
#include "inventory/raw_record.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// EC2Inventory - Multi-Region Cloud Instance Inventory
// 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ec2inventory {
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
/// Raised if a region cannot be listed with the current credentials or network
class RegionAccessError : public std::runtime_error {
    /// The region
    std::string _region;
    /// The provider error code
    std::string _code;

    public:
    /// The constructor
    RegionAccessError(std::string region, std::string code, const std::string& message);

    /// Get the region
    [[nodiscard]] const std::string& getRegion() const { return _region; }
    /// Get the provider error code
    [[nodiscard]] const std::string& getCode() const { return _code; }
};
//---------------------------------------------------------------------------
/// One page of the instance listing
struct DescribeInstancesPage {
    /// The reservations of the page
    std::vector<inventory::RawReservation> reservations;
    /// The continuation token, unset on the last page
    std::optional<std::string> nextToken;
};
//---------------------------------------------------------------------------
/// The instance listing of a single region
class RegionClient {
    public:
    /// The destructor
    virtual ~RegionClient() noexcept = default;
    /// Get the region
    [[nodiscard]] virtual const std::string& getRegion() const = 0;
    /// Requests one page, the first page is requested without token. Throws RegionAccessError.
    [[nodiscard]] virtual DescribeInstancesPage describeInstances(const std::optional<std::string>& nextToken) = 0;
};
//---------------------------------------------------------------------------
/// Implements the cloud provider abstraction
class Provider {
    public:
    /// The destructor
    virtual ~Provider() noexcept = default;

    /// Creates a client for the region. Throws RegionAccessError.
    [[nodiscard]] virtual std::unique_ptr<RegionClient> makeClient(const std::string& region) = 0;
    /// The regions that are listed if no region was requested
    [[nodiscard]] virtual std::vector<std::string> getDefaultRegions() const = 0;

    /// Parse a comma separated region list
    [[nodiscard]] static std::vector<std::string> parseRegionList(std::string_view list);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace ec2inventory
