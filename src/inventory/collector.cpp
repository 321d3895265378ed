#include "inventory/collector.hpp"
#include "cloud/provider.hpp"
#include "inventory/errors.hpp"
#include "utils/log.hpp"
#include <optional>
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
vector<RawInstance> Collector::describeInstancesPaginated(cloud::RegionClient& client)
// Requests pages as long as a continuation token is returned
{
    vector<RawInstance> instances;
    optional<string> nextToken;
    do {
        auto page = client.describeInstances(nextToken);
        for (auto& reservation : page.reservations)
            for (auto& instance : reservation.instances)
                instances.push_back(move(instance));
        nextToken = move(page.nextToken);
    } while (nextToken);
    return instances;
}
//---------------------------------------------------------------------------
vector<Instance> Collector::collect(const vector<string>& requestedRegions)
// Pulls all regions and converts the records afterwards
{
    auto regions = requestedRegions.empty() ? _provider.getDefaultRegions() : requestedRegions;

    // The raw records of every accessible region, in region order
    vector<pair<string, vector<RawInstance>>> pulled;
    _log.info("started pulling instances");
    for (const auto& region : regions) {
        try {
            auto client = _provider.makeClient(region);
            auto instances = describeInstancesPaginated(*client);
            _log.debug("pulled " + to_string(instances.size()) + " instances from region " + region);
            pulled.emplace_back(region, move(instances));
        } catch (const cloud::RegionAccessError& e) {
            // Credentials may only cover a subset of the regions
            _log.error("Could not pull instances from region " + region + ": " + e.what());
        }
    }
    _log.info("finished pulling instances");

    _log.info("processing raw data into objects");
    vector<Instance> result;
    for (const auto& [region, instances] : pulled) {
        for (const auto& raw : instances) {
            try {
                result.push_back(_normalizer.toInstance(raw));
            } catch (const MissingFieldError& e) {
                throw MissingFieldError(e.getField(), e.getInstanceId(), e.getNetworkInterfaceId(), region);
            }
        }
    }
    _log.info("finished processing the raw data");
    return result;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
