#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
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
string_view Log::getLevelName(Level level) noexcept
// Get the printable level
{
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}
//---------------------------------------------------------------------------
Log::Level Log::parseLevel(string_view name)
// Parses the level name of the command line
{
    if (name == "debug" || name == "DEBUG")
        return Level::Debug;
    if (name == "info" || name == "INFO")
        return Level::Info;
    if (name == "error" || name == "ERROR")
        return Level::Error;
    throw invalid_argument("Unknown log level: " + string(name));
}
//---------------------------------------------------------------------------
void StreamLog::write(Level level, string_view message)
// Writes a single line
{
    if (level < _level)
        return;
    _stream << formatTimestamp(chrono::system_clock::now()) << " " << getLevelName(level) << " " << message << "\n";
    _stream.flush();
}
//---------------------------------------------------------------------------
uint64_t MemoryLog::count(Level level) const
// Counts the entries of one level
{
    return static_cast<uint64_t>(count_if(_entries.begin(), _entries.end(), [level](const Entry& e) { return e.level == level; }));
}
//---------------------------------------------------------------------------
bool MemoryLog::contains(Level level, string_view needle) const
// Searches the messages of one level
{
    for (const auto& e : _entries)
        if (e.level == level && e.message.find(needle) != string::npos)
            return true;
    return false;
}
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils
