/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <string>
#include <string_view>

namespace vecanim::compiler {

    // Fixed-point rounding with trailing zeros removed: 1.23456 -> "1.2346", 2.0 -> "2", -0.00001 -> "0"
    [[nodiscard]] std::string roundNumber(double value, int precision);

    // Rounds every fully numeric token; separators and other tokens are kept as written
    [[nodiscard]] std::string formatValue(std::string_view value, int precision);

    // formatValue applied to each ';' entry
    [[nodiscard]] std::string formatValues(std::string_view values, int precision);

    // ';' separated fractions, each rounded
    [[nodiscard]] std::string formatKeyPoints(std::string_view key_points, int precision);

    // Rounds the numbers embedded in path data ("M10.123456,20" -> "M10.1235,20")
    [[nodiscard]] std::string optimizePath(std::string_view path, int precision);

    // Escapes & < > " for use inside a double-quoted attribute
    [[nodiscard]] std::string escapeXml(std::string_view value);

} // namespace vecanim::compiler
