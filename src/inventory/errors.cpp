#include "inventory/errors.hpp"
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
string MissingFieldError::buildMessage(const string& field, const string& instanceId, const string& networkInterfaceId, const string& region)
// Builds the message with the known record context
{
    string message = "Missing required field '" + field + "'";
    if (!networkInterfaceId.empty())
        message += " in network interface " + networkInterfaceId;
    if (!instanceId.empty())
        message += " in instance " + instanceId;
    if (!region.empty())
        message += " in region " + region;
    return message;
}
//---------------------------------------------------------------------------
MissingFieldError::MissingFieldError(string field, string instanceId, string networkInterfaceId, string region)
    : runtime_error(buildMessage(field, instanceId, networkInterfaceId, region)), _field(move(field)), _instanceId(move(instanceId)), _networkInterfaceId(move(networkInterfaceId)), _region(move(region))
// The constructor
{
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::inventory
