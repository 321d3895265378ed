#pragma once
#include <chrono>
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
namespace ec2inventory::utils {
//---------------------------------------------------------------------------
/// Format a time point as ISO-8601 UTC timestamp (e.g. 2021-03-01T12:00:00Z)
std::string formatTimestamp(std::chrono::system_clock::time_point timePoint);
/// Strip leading and trailing whitespace
std::string_view trim(std::string_view value) noexcept;
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils
