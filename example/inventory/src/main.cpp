#include "cli/options.hpp"
#include "cloud/aws.hpp"
#include "inventory/collector.hpp"
#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
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
using namespace std;
using namespace ec2inventory;
//---------------------------------------------------------------------------
static string formatAddress(const optional<utils::IpAddress>& address)
// Prints an address or a dash
{
    return address ? address->toString() : "-";
}
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    cli::Options options;
    try {
        options = cli::Options::parse(argc, argv);
    } catch (const invalid_argument& e) {
        cerr << e.what() << "\n\n"
             << cli::Options::getHelpText() << endl;
        return -1;
    }
    if (options.help) {
        cout << cli::Options::getHelpText() << endl;
        return 0;
    }

    cloud::AWS::Settings awsSettings;
    awsSettings.endpoint = options.endpoint;
    awsSettings.https = options.https;

    utils::StreamLog log(cerr, options.logLevel);
    cloud::AWSSDKGuard sdk;
    cloud::AWS aws(awsSettings);
    inventory::Collector collector(aws, log);

    vector<inventory::Instance> instances;
    try {
        instances = collector.collect(options.regions);
    } catch (const runtime_error& e) {
        // A malformed record (MissingFieldError) or a failed request, the inventory would be incomplete
        cerr << e.what() << endl;
        return -1;
    }

    for (const auto& instance : instances) {
        string primaryPrivate = "-";
        string primaryPublic = "-";
        if (!instance.networkInterfaces.empty()) {
            primaryPrivate = formatAddress(instance.networkInterfaces.front().privateIpAddress);
            primaryPublic = formatAddress(instance.networkInterfaces.front().publicIpAddress);
        }
        cout << instance.instanceId << "\t" << instance.instanceType << "\t" << instance.state.name << "\t" << utils::formatTimestamp(instance.launchTime) << "\t" << primaryPrivate << "\t" << primaryPublic << "\n";
    }
    cout << instances.size() << " instances" << endl;

    return 0;
}
//---------------------------------------------------------------------------
