#include "padding.hpp"

#include <stdexcept>
#include <string>

namespace nflz
{

std::size_t CountDigits(std::uint64_t number)
{
    std::size_t digits = 0;
    while (number != 0)
    {
        number /= 10;
        ++digits;
    }
    return digits;
}

std::size_t LeadingZeroCount(std::uint64_t value, std::size_t target_width)
{
    std::size_t digits = CountDigits(value);
    if (digits > target_width)
    {
        throw std::out_of_range("数字 " + std::to_string(value) + " 的位数超过了目标宽度 " +
                                std::to_string(target_width));
    }
    return target_width - digits;
}

} // namespace nflz
