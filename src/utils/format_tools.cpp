/**
 * @file format_tools.cpp
 * @brief Implements the non-template helpers declared in utils/format_tools.hpp.
 */
#include "utils/format_tools.hpp"

#include <fmt/chrono.h>

namespace locklab::format_tools
{

namespace
{
constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view s) noexcept
{
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}
} // namespace

// fmt 9 prints the fractional seconds of a microsecond time_point inconsistently across
// versions, so the fraction is appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    int fractional_us = static_cast<int>((tp_us - secs).count());
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::optional<std::string> extract_value_from_string(std::string_view keyword,
                                                     std::string_view input, char separator,
                                                     char assignment_symbol)
{
    size_t pos = 0;
    while (pos <= input.size())
    {
        auto end = input.find(separator, pos);
        if (end == std::string_view::npos)
            end = input.size();

        const auto pair = input.substr(pos, end - pos);
        const auto eq = pair.find(assignment_symbol);
        if (eq != std::string_view::npos && trim(pair.substr(0, eq)) == keyword)
        {
            return std::string(trim(pair.substr(eq + 1)));
        }

        if (end == input.size())
            break;
        pos = end + 1;
    }
    return std::nullopt;
}

} // namespace locklab::format_tools
