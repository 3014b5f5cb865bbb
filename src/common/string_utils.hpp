#pragma once

#include <string>
#include <string_view>

// Trims leading and trailing whitespace, referencing the original string.
[[nodiscard]] std::string_view trim(std::string_view str);

// Return true if an argument is completely numeric (with an optional leading sign).
[[nodiscard]] bool is_number(std::string_view sv);

// Returns the string, lower-cased.
[[nodiscard]] std::string lower_case(std::string_view str);

// Case insensitive equality.
[[nodiscard]] bool matches(std::string_view lhs, std::string_view rhs);

// Is 'needle' contained inside 'haystack' case insensitively?
[[nodiscard]] bool matches_inside(std::string_view needle, std::string_view haystack);

// Escapes the characters that may not appear literally inside an XML attribute value: & < > "
[[nodiscard]] std::string xml_escape(std::string_view str);
