/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "value_format.hpp"
#include "animation/value_parsing.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace vecanim::compiler {

    namespace {
        constexpr bool isDigit(const char c) { return c >= '0' && c <= '9'; }

        constexpr bool isSeparator(const char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',';
        }
    } // namespace

    std::string roundNumber(const double value, const int precision) {
        if (!std::isfinite(value)) {
            return fmt::format("{}", value);
        }

        std::string text = fmt::format("{:.{}f}", value, precision < 0 ? 0 : precision);
        if (text.find('.') != std::string::npos) {
            while (text.back() == '0') {
                text.pop_back();
            }
            if (text.back() == '.') {
                text.pop_back();
            }
        }
        if (text == "-0") {
            text = "0";
        }
        return text;
    }

    std::string formatValue(std::string_view value, const int precision) {
        std::string out;
        out.reserve(value.size());

        size_t pos = 0;
        while (pos < value.size()) {
            if (isSeparator(value[pos])) {
                out += value[pos++];
                continue;
            }

            const size_t start = pos;
            while (pos < value.size() && !isSeparator(value[pos])) {
                ++pos;
            }
            const std::string_view token = value.substr(start, pos - start);
            if (animation::isNumericToken(token)) {
                out += roundNumber(*animation::parseNumber(token), precision);
            } else {
                out += token;
            }
        }
        return out;
    }

    std::string formatValues(std::string_view values, const int precision) {
        std::string out;
        size_t start = 0;
        while (true) {
            const size_t next = values.find(';', start);
            const auto entry = animation::trim(values.substr(start, next == std::string_view::npos ? std::string_view::npos : next - start));
            out += formatValue(entry, precision);
            if (next == std::string_view::npos) {
                break;
            }
            out += ';';
            start = next + 1;
        }
        return out;
    }

    std::string formatKeyPoints(std::string_view key_points, const int precision) {
        std::string out;
        size_t start = 0;
        while (true) {
            const size_t next = key_points.find(';', start);
            const auto entry = animation::trim(key_points.substr(start, next == std::string_view::npos ? std::string_view::npos : next - start));
            if (const auto number = animation::parseNumber(entry)) {
                out += roundNumber(*number, precision);
            } else {
                out += entry;
            }
            if (next == std::string_view::npos) {
                break;
            }
            out += ';';
            start = next + 1;
        }
        return out;
    }

    std::string optimizePath(std::string_view path, const int precision) {
        std::string out;
        out.reserve(path.size());

        size_t pos = 0;
        while (pos < path.size()) {
            const bool negative = path[pos] == '-' && pos + 1 < path.size() && isDigit(path[pos + 1]);
            if (!negative && !isDigit(path[pos])) {
                out += path[pos++];
                continue;
            }

            // -?\d+(\.\d*)?
            const size_t start = pos;
            if (negative) {
                ++pos;
            }
            while (pos < path.size() && isDigit(path[pos])) {
                ++pos;
            }
            if (pos < path.size() && path[pos] == '.') {
                ++pos;
                while (pos < path.size() && isDigit(path[pos])) {
                    ++pos;
                }
            }

            const auto number = animation::parseNumber(path.substr(start, pos - start));
            out += number ? roundNumber(*number, precision) : std::string(path.substr(start, pos - start));
        }
        return out;
    }

    std::string escapeXml(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (const char c : value) {
            switch (c) {
                case '&':
                    out += "&amp;";
                    break;
                case '"':
                    out += "&quot;";
                    break;
                case '<':
                    out += "&lt;";
                    break;
                case '>':
                    out += "&gt;";
                    break;
                default:
                    out += c;
            }
        }
        return out;
    }

} // namespace vecanim::compiler
