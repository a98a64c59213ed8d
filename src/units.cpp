#include "units.hpp"

#include "encoding.hpp"

#include <limits>
#include <stdexcept>

namespace raffle {

namespace {

namespace mp = boost::multiprecision;

// Base-10 accumulation. The string constructor of cpp_int treats a leading
// zero as an octal prefix, which zero-padded fractions always have.
mp::cpp_int decimalValue(const std::string& digits) {
    mp::cpp_int value = 0;
    for (char c : digits) {
        value *= 10;
        value += static_cast<unsigned>(c - '0');
    }
    return value;
}

Wei narrow(const mp::cpp_int& wide, const std::string& original) {
    if (wide > mp::cpp_int(std::numeric_limits<Wei>::max())) {
        throw std::out_of_range("amount exceeds 256-bit range: " + original);
    }
    return static_cast<Wei>(wide);
}

} // namespace

Wei weiPerEther() {
    static const Wei unit = mp::pow(Wei(10), kEtherDecimals);
    return unit;
}

Wei parseWei(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || !isDecimalDigits(value)) {
        throw std::invalid_argument("wei amount must be a non-negative integer: \"" + text + "\"");
    }
    return narrow(decimalValue(value), text);
}

Wei parseEther(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw std::invalid_argument("ether amount must not be empty");
    }

    std::string whole = value;
    std::string fraction;
    const auto dot = value.find('.');
    if (dot != std::string::npos) {
        whole = value.substr(0, dot);
        fraction = value.substr(dot + 1);
    }
    if (whole.empty() && fraction.empty()) {
        throw std::invalid_argument("ether amount has no digits: \"" + text + "\"");
    }
    if (!isDecimalDigits(whole) || !isDecimalDigits(fraction)) {
        throw std::invalid_argument("ether amount must be a plain decimal: \"" + text + "\"");
    }
    if (fraction.size() > kEtherDecimals) {
        throw std::invalid_argument("ether amount has more than 18 decimals: \"" + text + "\"");
    }

    fraction.append(kEtherDecimals - fraction.size(), '0');
    mp::cpp_int wide = decimalValue(whole);
    wide *= mp::cpp_int(weiPerEther());
    wide += decimalValue(fraction);
    return narrow(wide, text);
}

std::string formatWei(const Wei& amount) {
    return amount.str();
}

std::string formatEther(const Wei& amount) {
    const Wei unit = weiPerEther();
    Wei whole = amount / unit;
    Wei remainder = amount % unit;

    std::string fraction = remainder.str();
    fraction.insert(0, kEtherDecimals - fraction.size(), '0');
    const auto last = fraction.find_last_not_of('0');
    fraction = (last == std::string::npos) ? "0" : fraction.substr(0, last + 1);
    return whole.str() + "." + fraction;
}

} // namespace raffle
