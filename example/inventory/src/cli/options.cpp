#include "cli/options.hpp"
#include "cloud/provider.hpp"
#include <cstdlib>
#include <cstring>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
string_view Options::getHelpText()
// The usage
{
    return "EC2Inventory [OPTIONS]\n\n"
           "OPTIONS:\n"
           "-r regionList (comma separated, default: all commercial regions)\n"
           "-e endpoint (custom EC2 endpoint)\n"
           "-s https (default: 1)\n"
           "-l logLevel [debug, info, error] (default: debug)\n"
           "-h, --help (print this text)\n";
}
//---------------------------------------------------------------------------
Options Options::parse(int argc, const char* const argv[])
// Reads the options in the order they are given
{
    Options options;
    for (auto i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "-h") || !strcmp(argv[i], "--help")) {
            options.help = true;
            return options;
        }
        if ((i + 1) >= argc)
            throw invalid_argument("Missing value for option " + string(argv[i]));
        if (!strcmp(argv[i], "-r")) {
            options.regions = cloud::Provider::parseRegionList(argv[++i]);
        } else if (!strcmp(argv[i], "-e")) {
            options.endpoint = argv[++i];
        } else if (!strcmp(argv[i], "-s")) {
            options.https = atoi(argv[++i]);
        } else if (!strcmp(argv[i], "-l")) {
            options.logLevel = utils::Log::parseLevel(argv[++i]);
        } else {
            throw invalid_argument("Unknown option " + string(argv[i]));
        }
    }
    return options;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::cli
