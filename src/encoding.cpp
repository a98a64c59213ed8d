#include "encoding.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace raffle {

namespace {

int hexValue(unsigned char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return std::tolower(c) - 'a' + 10;
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool isDecimalDigits(const std::string& value) {
    for (unsigned char c : value) {
        if (std::isdigit(c) == 0) {
            return false;
        }
    }
    return true;
}

bool isHexDigits(const std::string& value, std::size_t expectedLength) {
    if (expectedLength != 0 && value.size() != expectedLength) {
        return false;
    }
    for (unsigned char c : value) {
        if (std::isxdigit(c) == 0) {
            return false;
        }
    }
    return true;
}

std::uint64_t parseUnsignedDecimal(const std::string& name, const std::string& value, std::uint64_t maxValue) {
    if (value.empty() || !isDecimalDigits(value)) {
        throw std::invalid_argument(name + " must be an unsigned integer, got \"" + value + "\"");
    }
    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: " + value);
    }
    if (parsed > maxValue) {
        std::ostringstream oss;
        oss << name << " must not exceed " << maxValue << ", got " << parsed;
        throw std::invalid_argument(oss.str());
    }
    return parsed;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    static const char* const kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    if (!isHexDigits(hex)) {
        throw std::invalid_argument("hex string contains a non-hex character");
    }

    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hexValue(static_cast<unsigned char>(hex[i]));
        const int low = hexValue(static_cast<unsigned char>(hex[i + 1]));
        out.push_back(static_cast<unsigned char>((high << 4) | low));
    }
    return out;
}

} // namespace raffle
