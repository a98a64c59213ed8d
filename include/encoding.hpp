#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace raffle {

std::string trim(const std::string& value);

bool isDecimalDigits(const std::string& value);

// Plain unsigned decimal no larger than maxValue; `name` labels the
// std::invalid_argument thrown otherwise.
std::uint64_t parseUnsignedDecimal(const std::string& name,
                                   const std::string& value,
                                   std::uint64_t maxValue = std::numeric_limits<std::uint64_t>::max());

// True when every character is a hex digit and, if expectedLength is non-zero,
// there are exactly that many.
bool isHexDigits(const std::string& value, std::size_t expectedLength = 0);

std::string bytesToHex(const unsigned char* data, std::size_t len);

// Lower or upper case; throws std::invalid_argument on odd length or any
// non-hex character.
std::vector<unsigned char> hexToBytes(const std::string& hex);

} // namespace raffle
