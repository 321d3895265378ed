#pragma once
#include "utils/log.hpp"
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
namespace ec2inventory::cli {
//---------------------------------------------------------------------------
/// The command line options of the inventory tool
struct Options {
    /// The requested regions, empty means the provider defaults
    std::vector<std::string> regions;
    /// The custom endpoint
    std::string endpoint;
    /// Use https?
    bool https = true;
    /// The minimum log level
    utils::Log::Level logLevel = utils::Log::Level::Debug;
    /// Was help requested?
    bool help = false;

    /// Parse the arguments, throws std::invalid_argument on unknown options or missing values
    [[nodiscard]] static Options parse(int argc, const char* const argv[]);
    /// Get the help text
    [[nodiscard]] static std::string_view getHelpText();
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::cli
