#pragma once
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
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
/// Raised if a string is not a valid IPv4 or IPv6 address
class AddressParseError : public std::runtime_error {
    public:
    /// The constructor
    explicit AddressParseError(std::string_view address) : std::runtime_error("Invalid IP address: '" + std::string(address) + "'") {}
};
//---------------------------------------------------------------------------
/// A parsed IPv4 or IPv6 address
class IpAddress {
    public:
    /// The address family
    enum class Family : uint8_t {
        IPv4 = 4,
        IPv6 = 6
    };

    private:
    /// The family
    Family _family = Family::IPv4;
    /// The address in network byte order, IPv4 uses the first 4 bytes
    std::array<uint8_t, 16> _bytes{};

    /// The constructor
    IpAddress() = default;

    public:
    /// Parses dotted IPv4 or textual IPv6 (without zone index), throws AddressParseError
    [[nodiscard]] static IpAddress parse(std::string_view address);

    /// Get the family
    [[nodiscard]] Family getFamily() const { return _family; }
    /// Is it an IPv4 address?
    [[nodiscard]] bool isV4() const { return _family == Family::IPv4; }
    /// Is it an IPv6 address?
    [[nodiscard]] bool isV6() const { return _family == Family::IPv6; }
    /// Get the raw bytes
    [[nodiscard]] const std::array<uint8_t, 16>& getBytes() const { return _bytes; }
    /// Get the canonical text representation
    [[nodiscard]] std::string toString() const;

    /// Compare addresses
    bool operator==(const IpAddress& other) const = default;
};
//---------------------------------------------------------------------------
} // namespace ec2inventory::utils
