#pragma once
#include <cstdint>
#include <ostream>
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
namespace ec2inventory::utils {
//---------------------------------------------------------------------------
/// The diagnostic sink that is handed to the collector and the normalizer
class Log {
    public:
    /// The severity levels
    enum class Level : uint8_t {
        Debug = 0,
        Info = 1,
        Error = 2
    };

    /// The destructor
    virtual ~Log() noexcept = default;
    /// Writes a message with the given severity
    virtual void write(Level level, std::string_view message) = 0;

    /// Writes a debug message
    void debug(std::string_view message) { write(Level::Debug, message); }
    /// Writes an info message
    void info(std::string_view message) { write(Level::Info, message); }
    /// Writes an error message
    void error(std::string_view message) { write(Level::Error, message); }

    /// Get the name of the level
    [[nodiscard]] static std::string_view getLevelName(Level level) noexcept;
    /// Parse a level name, throws std::invalid_argument on unknown names
    [[nodiscard]] static Level parseLevel(std::string_view name);
};
//---------------------------------------------------------------------------
/// Writes timestamped lines to an output stream
class StreamLog : public Log {
    /// The output stream
    std::ostream& _stream;
    /// The minimum level that is written
    Level _level;

    public:
    /// The constructor
    explicit StreamLog(std::ostream& stream, Level level = Level::Debug) : _stream(stream), _level(level) {}
    /// Writes the message if it passes the level
    void write(Level level, std::string_view message) override;
    /// Get the minimum level
    [[nodiscard]] Level getLevel() const { return _level; }
};
//---------------------------------------------------------------------------
/// Keeps all messages in memory
class MemoryLog : public Log {
    public:
    /// A logged message
    struct Entry {
        /// The level
        Level level;
        /// The message
        std::string message;
    };

    private:
    /// The entries in order of arrival
    std::vector<Entry> _entries;

    public:
    /// Stores the message
    void write(Level level, std::string_view message) override { _entries.push_back({level, std::string(message)}); }
    /// Get all entries
    [[nodiscard]] const std::vector<Entry>& getEntries() const { return _entries; }
    /// Number of entries with the level
    [[nodiscard]] uint64_t count(Level level) const;
    /// Is there an entry with the level that contains the needle?
    [[nodiscard]] bool contains(Level level, std::string_view needle) const;
    /// Drops all entries
    void clear() { _entries.clear(); }
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils
