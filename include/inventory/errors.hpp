#pragma once
#include <stdexcept>
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
/// Raised if a required key is missing in a raw record, aborts the collection
class MissingFieldError : public std::runtime_error {
    /// The missing key
    std::string _field;
    /// The instance id, if it was already known
    std::string _instanceId;
    /// The network interface id, if the key belongs to an interface whose id was already known
    std::string _networkInterfaceId;
    /// The region of the record, if known
    std::string _region;

    /// Builds the message
    static std::string buildMessage(const std::string& field, const std::string& instanceId, const std::string& networkInterfaceId, const std::string& region);

    public:
    /// The constructor
    explicit MissingFieldError(std::string field, std::string instanceId = "", std::string networkInterfaceId = "", std::string region = "");

    /// Get the missing key
    [[nodiscard]] const std::string& getField() const { return _field; }
    /// Get the instance id, empty if unknown
    [[nodiscard]] const std::string& getInstanceId() const { return _instanceId; }
    /// Get the network interface id, empty if unknown
    [[nodiscard]] const std::string& getNetworkInterfaceId() const { return _networkInterfaceId; }
    /// Get the region, empty if unknown
    [[nodiscard]] const std::string& getRegion() const { return _region; }
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
