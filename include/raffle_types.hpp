#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace raffle {

using Address = std::string;
using Amount = std::uint64_t;
using RequestId = std::uint64_t;
using Timestamp = std::uint64_t; // seconds
using RandomWord = boost::multiprecision::uint256_t;

enum class RaffleState { OPEN, CALCULATING };

const char* toString(RaffleState state);

} // namespace raffle
