/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vecanim::animation {

    [[nodiscard]] std::string_view trim(std::string_view text);

    // Length of the decimal number at the start of text (sign, digits, fraction, exponent), 0 if none
    [[nodiscard]] size_t scanNumber(std::string_view text);

    // Leading-number parse: "2.5s" -> 2.5, "abc" -> nullopt. Leading whitespace and '+' are accepted.
    [[nodiscard]] std::optional<double> parseNumber(std::string_view text);

    // True only when the whole token is a number ("12.5", "-3e2"; not "10px")
    [[nodiscard]] bool isNumericToken(std::string_view token);

    // Clock value: "2s", "500ms", "1.5" (seconds). Unparsable -> nullopt.
    [[nodiscard]] std::optional<double> parseTimeStrict(std::string_view text);

    // Same as parseTimeStrict but malformed input resolves to 0
    [[nodiscard]] double parseTime(std::string_view text);

    // Splits on separator and trims every entry. Empty input yields an empty list.
    [[nodiscard]] std::vector<std::string> splitList(std::string_view text, char separator = ';');

    // Whitespace/comma separated numbers; tokens that are not numbers are dropped
    [[nodiscard]] std::vector<double> parseNumberList(std::string_view text);

} // namespace vecanim::animation
