/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "value_parsing.hpp"

#include <charconv>
#include <cmath>

namespace vecanim::animation {

    namespace {
        constexpr bool isDigit(const char c) { return c >= '0' && c <= '9'; }
        constexpr bool isSpace(const char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

        size_t skipDigits(std::string_view text, size_t pos) {
            while (pos < text.size() && isDigit(text[pos])) {
                ++pos;
            }
            return pos;
        }
    } // namespace

    std::string_view trim(std::string_view text) {
        while (!text.empty() && isSpace(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && isSpace(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

    size_t scanNumber(std::string_view text) {
        size_t pos = 0;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }

        const size_t int_start = pos;
        pos = skipDigits(text, pos);
        const size_t int_digits = pos - int_start;

        size_t frac_digits = 0;
        if (pos < text.size() && text[pos] == '.') {
            const size_t frac_end = skipDigits(text, pos + 1);
            frac_digits = frac_end - pos - 1;
            if (int_digits > 0 || frac_digits > 0) {
                pos = frac_end;
            }
        }

        if (int_digits == 0 && frac_digits == 0) {
            return 0;
        }

        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            size_t exp = pos + 1;
            if (exp < text.size() && (text[exp] == '+' || text[exp] == '-')) {
                ++exp;
            }
            const size_t exp_end = skipDigits(text, exp);
            if (exp_end > exp) {
                pos = exp_end;
            }
        }
        return pos;
    }

    std::optional<double> parseNumber(std::string_view text) {
        text = trim(text);
        const size_t length = scanNumber(text);
        if (length == 0) {
            return std::nullopt;
        }

        std::string_view number = text.substr(0, length);
        if (number.front() == '+') {
            number.remove_prefix(1);
        }

        double value = 0.0;
        const auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
        if (ec != std::errc{} || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    bool isNumericToken(std::string_view token) {
        return !token.empty() && scanNumber(token) == token.size() && parseNumber(token).has_value();
    }

    std::optional<double> parseTimeStrict(std::string_view text) {
        text = trim(text);
        const auto value = parseNumber(text);
        if (!value) {
            return std::nullopt;
        }
        if (text.ends_with("ms")) {
            return *value / 1000.0;
        }
        return value;
    }

    double parseTime(std::string_view text) {
        return parseTimeStrict(text).value_or(0.0);
    }

    std::vector<std::string> splitList(std::string_view text, const char separator) {
        std::vector<std::string> result;
        if (trim(text).empty()) {
            return result;
        }

        size_t start = 0;
        while (true) {
            const size_t next = text.find(separator, start);
            const auto piece = trim(text.substr(start, next == std::string_view::npos ? std::string_view::npos : next - start));
            result.emplace_back(piece);
            if (next == std::string_view::npos) {
                break;
            }
            start = next + 1;
        }

        // A trailing separator ("0;1;") does not introduce an entry
        if (!result.empty() && result.back().empty()) {
            result.pop_back();
        }
        return result;
    }

    std::vector<double> parseNumberList(std::string_view text) {
        std::vector<double> numbers;
        size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && (isSpace(text[pos]) || text[pos] == ',')) {
                ++pos;
            }
            const size_t start = pos;
            while (pos < text.size() && !isSpace(text[pos]) && text[pos] != ',') {
                ++pos;
            }
            if (pos > start) {
                if (const auto value = parseNumber(text.substr(start, pos - start))) {
                    numbers.push_back(*value);
                }
            }
        }
        return numbers;
    }

} // namespace vecanim::animation
