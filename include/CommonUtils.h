#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Formats a real as the shortest decimal that round-trips.
 * @post Fixed notation when the decimal exponent lies in [-4, 16), scientific
 *       otherwise ("0.0001", "1000000.0", "1e-05", "1e+16"). Integral fixed
 *       values carry a trailing ".0".
 */
inline std::string formatShortest(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0.0 ? "inf" : "-inf";

    char buf[400];
    const auto sci = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    if (sci.ec != std::errc()) {
        std::ostringstream os;
        os << value;
        return os.str();
    }
    std::string out(buf, sci.ptr);
    const int exponent = std::stoi(out.substr(out.find('e') + 1));
    if (exponent < -4 || exponent >= 16) return out;

    const auto fixed = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (fixed.ec != std::errc()) return out;
    out.assign(buf, fixed.ptr);
    if (out.find('.') == std::string::npos) out += ".0";
    return out;
}

inline std::string joinVector(const std::vector<double>& values, size_t maxItems = 12) {
    std::string out = "[";
    const size_t shown = std::min(values.size(), maxItems);
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) out += ", ";
        out += formatShortest(values[i]);
    }
    if (shown < values.size()) out += ", ...";
    out += "]";
    return out;
}

} // namespace CommonUtils
