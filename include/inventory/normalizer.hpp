#pragma once
#include "inventory/instance.hpp"
#include "inventory/raw_record.hpp"
#include "utils/ip_address.hpp"
#include <optional>
#include <string>
#include <string_view>
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
namespace utils {
class Log;
} // namespace utils
//---------------------------------------------------------------------------
namespace inventory {
//---------------------------------------------------------------------------
/// Maps raw provider records to typed instances.
/// Missing required keys raise MissingFieldError. Invalid addresses are logged
/// as errors and left unset, they never abort the record.
class Normalizer {
    /// The diagnostic sink
    utils::Log& _log;

    /// Parses an optional address, logs and drops invalid values
    [[nodiscard]] std::optional<utils::IpAddress> parseAddress(const std::optional<std::string>& value, std::string_view field, std::string_view interfaceId) const;

    public:
    /// The constructor
    explicit Normalizer(utils::Log& log) : _log(log) {}

    /// Converts an instance record and all of its interfaces
    [[nodiscard]] Instance toInstance(const RawInstance& raw) const;
    /// Converts an interface record, the instance id is only used for error context
    [[nodiscard]] NetworkInterface toNetworkInterface(const RawNetworkInterface& raw, std::string_view instanceId = "") const;
};
//---------------------------------------------------------------------------
} // namespace inventory
} // namespace ec2inventory
