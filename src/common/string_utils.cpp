#include "string_utils.hpp"

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/search.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

#include <algorithm>
#include <cctype>

namespace {
bool not_space(char c) { return !std::isspace(static_cast<unsigned char>(c)); }
char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
}

std::string_view trim(std::string_view str) {
    const auto begin = std::find_if(str.begin(), str.end(), not_space);
    const auto rit = std::find_if(str.rbegin(), std::make_reverse_iterator(begin), not_space);
    return {begin, static_cast<size_t>(rit.base() - begin)};
}

bool is_number(std::string_view sv) {
    if (sv.empty())
        return false;
    if (sv.front() == '-' || sv.front() == '+')
        sv.remove_prefix(1);
    return !sv.empty() && ranges::all_of(sv, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::string lower_case(std::string_view str) {
    return str | ranges::views::transform(to_lower) | ranges::to<std::string>;
}

bool matches(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return ranges::all_of(ranges::views::zip(lhs, rhs),
                          [](auto pr) { return to_lower(pr.first) == to_lower(pr.second); });
}

bool matches_inside(std::string_view needle, std::string_view haystack) {
    auto needle_low = needle | ranges::views::transform(to_lower);
    auto haystack_low = haystack | ranges::views::transform(to_lower);
    return !ranges::search(haystack_low, needle_low).empty();
}

std::string xml_escape(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (auto c : str) {
        switch (c) {
        case '&': result += "&amp;"; break;
        case '<': result += "&lt;"; break;
        case '>': result += "&gt;"; break;
        case '"': result += "&quot;"; break;
        default: result += c; break;
        }
    }
    return result;
}
