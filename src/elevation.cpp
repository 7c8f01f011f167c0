#include "layerkit/elevation.hpp"
#include "layerkit/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>

namespace layerkit {

    namespace detail {
        struct NamedElevation {
            std::string_view name;
            Elevation value;
        };

        constexpr NamedElevation named_elevations[] = {
            {"Equator", elevations::Equator},
            {"NorthPole", elevations::NorthPole},
            {"SouthPole", elevations::SouthPole},
            {"TropicOfCapricorn", elevations::TropicOfCapricorn},
            {"TropicOfCancer", elevations::TropicOfCancer},
        };

        inline bool iequals(std::string_view a, std::string_view b) {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                       return std::tolower(static_cast<unsigned char>(x)) ==
                              std::tolower(static_cast<unsigned char>(y));
                   });
        }

        inline void skip_spaces(std::string_view &s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
        }

        inline std::string_view trim(std::string_view s) {
            skip_spaces(s);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        inline bool consume(std::string_view &s, std::string_view token) {
            if (s.substr(0, token.size()) != token)
                return false;
            s.remove_prefix(token.size());
            return true;
        }

        // Reads an unsigned decimal number written with the culture's separators from the front of `s`.
        inline std::optional<double> read_number(std::string_view &s, const Culture &culture, bool allow_grouping) {
            std::string normalized;
            bool seen_digit = false;
            bool seen_decimal = false;
            std::size_t i = 0;

            auto is_digit = [&](std::size_t at) {
                return at < s.size() && std::isdigit(static_cast<unsigned char>(s[at]));
            };

            while (i < s.size()) {
                char c = s[i];
                if (std::isdigit(static_cast<unsigned char>(c))) {
                    normalized += c;
                    seen_digit = true;
                    ++i;
                } else if (c == culture.decimal_separator && !seen_decimal) {
                    normalized += '.';
                    seen_decimal = true;
                    ++i;
                } else if (allow_grouping && c == culture.group_separator && c != culture.decimal_separator &&
                           seen_digit && !seen_decimal && is_digit(i + 1) && is_digit(i + 2) && is_digit(i + 3) &&
                           !is_digit(i + 4)) {
                    // Group separators only between full groups of three digits
                    ++i;
                } else {
                    break;
                }
            }

            if (!seen_digit)
                return std::nullopt;

            // Optional exponent, as written by toString() for very large or small values
            if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < s.size() && (s[j] == '+' || s[j] == '-'))
                    ++j;
                if (is_digit(j)) {
                    normalized += 'e';
                    normalized.append(s.substr(i + 1, j - i - 1));
                    while (is_digit(j))
                        normalized += s[j++];
                    i = j;
                }
            }

            double value = 0.0;
            auto result = std::from_chars(normalized.data(), normalized.data() + normalized.size(), value);
            if (result.ec != std::errc() || result.ptr != normalized.data() + normalized.size())
                return std::nullopt;

            s.remove_prefix(i);
            return value;
        }

        [[noreturn]] inline void fail(std::string_view text, const char *reason) {
            throw FormatError("layerkit::Elevation::parse(): \"" + std::string(text) + "\" " + reason);
        }
    } // namespace detail

    Elevation Elevation::parse(std::string_view text, const Culture &culture) {
        std::string_view s = detail::trim(text);
        if (s.empty())
            detail::fail(text, "is empty");

        for (const auto &named : detail::named_elevations) {
            if (detail::iequals(s, named.name))
                return named.value;
        }

        bool negative = false;
        if (s.front() == '-' || s.front() == '+') {
            negative = s.front() == '-';
            s.remove_prefix(1);
            detail::skip_spaces(s);
        }

        auto degrees = detail::read_number(s, culture, true);
        if (!degrees)
            detail::fail(text, "is not a number");
        double value = *degrees;

        detail::skip_spaces(s);
        bool has_degree_sign = detail::consume(s, DegreeSymbol);
        detail::skip_spaces(s);

        if (!s.empty()) {
            if (!has_degree_sign)
                detail::fail(text, "has trailing characters");

            auto minutes = detail::read_number(s, culture, false);
            detail::skip_spaces(s);
            if (!minutes || !detail::consume(s, "'"))
                detail::fail(text, "has malformed minutes");
            if (*minutes >= 60.0)
                detail::fail(text, "has minutes out of range");
            value += *minutes / 60.0;
            detail::skip_spaces(s);

            if (!s.empty()) {
                auto seconds = detail::read_number(s, culture, false);
                detail::skip_spaces(s);
                if (!seconds || !detail::consume(s, "\""))
                    detail::fail(text, "has malformed seconds");
                if (*seconds >= 60.0)
                    detail::fail(text, "has seconds out of range");
                value += *seconds / 3600.0;
                detail::skip_spaces(s);
            }

            if (!s.empty())
                detail::fail(text, "has trailing characters");
        }

        return Elevation(negative ? -value : value);
    }

    std::string Elevation::toString(const Culture &culture) const {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        // Avoid "-0"
        double value = decimal_degrees_ == 0.0 ? 0.0 : decimal_degrees_;
        oss << std::setprecision(15) << value;

        std::string out = oss.str();
        if (culture.decimal_separator != '.')
            std::replace(out.begin(), out.end(), '.', culture.decimal_separator);
        out += DegreeSymbol;
        return out;
    }

    std::ostream &operator<<(std::ostream &os, const Elevation &elevation) { return os << elevation.toString(); }

} // namespace layerkit
