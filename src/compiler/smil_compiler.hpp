/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation/animation_record.hpp"
#include "core/parameters.hpp"

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace vecanim::compiler {

    struct CompileOptions {
        bool optimize = true; // Round inline motion path data
        int precision = core::param::DEFAULT_COMPILE_PRECISION;

        [[nodiscard]] static CompileOptions fromParameters(const core::param::CompilerParameters& params) {
            return {params.optimize, params.precision};
        }
    };

    // Partial override applied on top of the compiler defaults for one call
    struct CompileOverrides {
        std::optional<bool> optimize;
        std::optional<int> precision;
    };

    class CompileError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct CompileResult {
        std::vector<std::string> elements;
        std::vector<std::string> warnings;
        std::vector<std::string> defs; // Reserved for shared definitions, currently always empty
    };

    struct ValidationResult {
        bool valid = true;
        std::vector<std::string> errors;
    };

    // Serializes animation records into SMIL markup
    class SmilCompiler {
    public:
        SmilCompiler() = default;
        explicit SmilCompiler(const CompileOptions& defaults) : defaults_(defaults) {}

        void setDefaultOptions(const CompileOverrides& overrides);
        [[nodiscard]] const CompileOptions& defaultOptions() const { return defaults_; }

        // Throws CompileError for unsupported kinds and missing mandatory fields
        [[nodiscard]] std::string compile(const animation::AnimationRecord& record,
                                          const CompileOverrides& overrides = {}) const;

        // Compiles records grouped by target. Failures become warnings and never stop the batch.
        [[nodiscard]] CompileResult compileAll(std::span<const animation::AnimationRecord> records,
                                               const CompileOverrides& overrides = {}) const;

        // Never throws
        [[nodiscard]] ValidationResult validate(const animation::AnimationRecord& record) const;

    private:
        [[nodiscard]] CompileOptions resolve(const CompileOverrides& overrides) const;

        CompileOptions defaults_;
    };

} // namespace vecanim::compiler
