/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <unordered_map>

namespace vecanim::animation {

    // Element as supplied by the element store. The core only looks at the id.
    struct CanvasElement {
        std::string id;
        std::string type;
        nlohmann::json data = nlohmann::json::object();
    };

    using ElementIndex = std::unordered_map<std::string, CanvasElement>;

    [[nodiscard]] inline ElementIndex indexElements(std::span<const CanvasElement> elements) {
        ElementIndex index;
        index.reserve(elements.size());
        for (const auto& element : elements) {
            index[element.id] = element;
        }
        return index;
    }

} // namespace vecanim::animation
