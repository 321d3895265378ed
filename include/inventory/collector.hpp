#pragma once
#include "inventory/instance.hpp"
#include "inventory/normalizer.hpp"
#include "inventory/raw_record.hpp"
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
namespace ec2inventory {
//---------------------------------------------------------------------------
namespace cloud {
class Provider;
class RegionClient;
} // namespace cloud
namespace utils {
class Log;
} // namespace utils
//---------------------------------------------------------------------------
namespace inventory {
//---------------------------------------------------------------------------
/// Collects the instances of several regions, one region after the other.
/// Regions that cannot be accessed are logged and skipped, a record with a
/// missing required key aborts the whole collection with MissingFieldError.
class Collector {
    /// The provider
    cloud::Provider& _provider;
    /// The diagnostic sink
    utils::Log& _log;
    /// The normalizer
    Normalizer _normalizer;

    public:
    /// The constructor
    Collector(cloud::Provider& provider, utils::Log& log) : _provider(provider), _log(log), _normalizer(log) {}

    /// Collects the instances of the regions in input order, uses the provider defaults if regions is empty
    [[nodiscard]] std::vector<Instance> collect(const std::vector<std::string>& regions);
    /// Pulls all pages of one region
    [[nodiscard]] static std::vector<RawInstance> describeInstancesPaginated(cloud::RegionClient& client);
};
//---------------------------------------------------------------------------
} // namespace inventory
} // namespace ec2inventory
