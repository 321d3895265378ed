#include "cloud/provider.hpp"
#include "utils/utils.hpp"
#include <string>
#include <utility>
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
//---------------------------------------------------------------------------
RegionAccessError::RegionAccessError(string region, string code, const string& message)
    : runtime_error("Could not access region " + region + " (" + code + "): " + message), _region(move(region)), _code(move(code))
// The constructor
{
}
//---------------------------------------------------------------------------
vector<string> Provider::parseRegionList(string_view list)
// Read a comma separated region list, blanks are stripped and empty entries skipped
{
    vector<string> regions;
    while (!list.empty()) {
        auto pos = list.find(',');
        auto entry = utils::trim(list.substr(0, pos));
        if (!entry.empty())
            regions.emplace_back(entry);
        if (pos == string_view::npos)
            break;
        list = list.substr(pos + 1);
    }
    return regions;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::cloud
