#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace raffle {

// Native currency in its smallest denomination; 1 ether = 10^18 wei.
using Wei = boost::multiprecision::uint256_t;

constexpr unsigned kEtherDecimals = 18;

Wei weiPerEther();

// Decimal ether string ("0.01", "2", "1.5") to wei. Rejects more than 18
// fractional digits, signs, exponents and values above 2^256 - 1.
Wei parseEther(const std::string& text);
Wei parseWei(const std::string& text);

std::string formatEther(const Wei& amount);
std::string formatWei(const Wei& amount);

} // namespace raffle
