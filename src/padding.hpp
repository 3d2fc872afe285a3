#pragma once

#include <cstddef>
#include <cstdint>

namespace nflz
{

// 不带前导零时数字的位数，例如 12345 => 5。
// 注意 0 的位数为 0（即 ceil(log10(n + 1))）。
std::size_t CountDigits(std::uint64_t number);

// 将 value 补齐到 target_width 位需要的前导零个数。
// value 的位数大于 target_width 时抛出 std::out_of_range。
std::size_t LeadingZeroCount(std::uint64_t value, std::size_t target_width);

} // namespace nflz
