#include "utils/utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
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
using namespace std;
//---------------------------------------------------------------------------
string formatTimestamp(chrono::system_clock::time_point timePoint)
// Creates the ISO-8601 timestamp
{
    stringstream s;
    const auto t = chrono::system_clock::to_time_t(timePoint);
    tm utc{};
    gmtime_r(&t, &utc);
    s << put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return s.str();
}
//---------------------------------------------------------------------------
string_view trim(string_view value) noexcept
// Strips whitespace on both sides
{
    constexpr string_view whitespace = " \t\r\n";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == string_view::npos)
        return string_view();
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils
