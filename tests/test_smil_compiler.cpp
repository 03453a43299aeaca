/* SPDX-FileCopyrightText: 2025 VecAnim Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "compiler/smil_compiler.hpp"
#include "compiler/value_format.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

using namespace vecanim::compiler;
using namespace vecanim::animation;

class SmilCompilerTest : public ::testing::Test {
protected:
    static AnimationRecord makeRecord(const std::string& id, const std::string& target, AnimationKind kind) {
        AnimationRecord record;
        record.id = id;
        record.target_element_id = target;
        record.kind = std::move(kind);
        return record;
    }

    static AnimationRecord fade() {
        auto record = makeRecord("fade", "rect", AttributeAnimate{"opacity"});
        record.from = "1";
        record.to = "0";
        record.dur = "2s";
        record.fill = FillMode::Freeze;
        return record;
    }

    std::string compileErrorOf(const AnimationRecord& record) const {
        try {
            (void)compiler.compile(record);
        } catch (const CompileError& e) {
            return e.what();
        }
        return {};
    }

    static bool hasError(const ValidationResult& result, const std::string& message) {
        return std::find(result.errors.begin(), result.errors.end(), message) != result.errors.end();
    }

    SmilCompiler compiler;
};

// ============================================================================
// Element output
// ============================================================================

TEST_F(SmilCompilerTest, AnimateFromTo) {
    EXPECT_EQ(compiler.compile(fade()),
              R"(<animate attributeName="opacity" from="1" to="0" dur="2s" fill="freeze"/>)");
}

TEST_F(SmilCompilerTest, ValuesAreRoundedPerEntry) {
    auto record = makeRecord("x", "rect", AttributeAnimate{"x"});
    record.values = "0.123456; 1.5 ;2";
    record.from = "7";
    record.dur = "1s";

    EXPECT_EQ(compiler.compile(record), R"(<animate attributeName="x" values="0.1235;1.5;2" dur="1s"/>)");
    EXPECT_EQ(compiler.compile(record, {.precision = 2}), R"(<animate attributeName="x" values="0.12;1.5;2" dur="1s"/>)");
}

TEST_F(SmilCompilerTest, NonNumericTokensPassThrough) {
    auto record = makeRecord("w", "rect", AttributeAnimate{"width"});
    record.values = "10px;20.55555px";

    EXPECT_EQ(compiler.compile(record), R"(<animate attributeName="width" values="10px;20.55555px"/>)");
}

TEST_F(SmilCompilerTest, AnimateTransform) {
    auto record = makeRecord("spin", "rect", TransformAnimate{TransformType::Rotate});
    record.from = "0 50 50";
    record.to = "360 50 50";
    record.dur = "4s";
    record.repeat_count = RepeatCount::forever();
    record.additive = Additive::Sum;

    EXPECT_EQ(compiler.compile(record),
              R"(<animateTransform attributeName="transform" type="rotate" from="0 50 50" to="360 50 50" )"
              R"(dur="4s" repeatCount="indefinite" additive="sum"/>)");
}

TEST_F(SmilCompilerTest, SplineEasingAttributes) {
    auto record = makeRecord("ease", "rect", AttributeAnimate{"x"});
    record.values = "0;100";
    record.dur = "1s";
    record.calc_mode = CalcMode::Spline;
    record.key_times = "0;1";
    record.key_splines = "0.42 0 0.58 1";
    record.accumulate = Accumulate::Sum;

    EXPECT_EQ(compiler.compile(record),
              R"(<animate attributeName="x" values="0;100" dur="1s" calcMode="spline" keyTimes="0;1" )"
              R"(keySplines="0.42 0 0.58 1" accumulate="sum"/>)");
}

TEST_F(SmilCompilerTest, MotionPrefersReferencedPath) {
    auto record = makeRecord("move", "dot", MotionAnimate{"M0 0 L10 10", "p1", MotionRotate{}, std::nullopt});
    record.dur = "3s";

    EXPECT_EQ(compiler.compile(record), R"(<animateMotion rotate="auto" dur="3s"><mpath href="#p1"/></animateMotion>)");
}

TEST_F(SmilCompilerTest, MotionRotateNoneIsOmitted) {
    auto record = makeRecord("move", "dot", MotionAnimate{std::nullopt, "p1", MotionRotate{RotateMode::None, 0.0}, std::nullopt});
    record.dur = "3s";

    EXPECT_EQ(compiler.compile(record), R"(<animateMotion dur="3s"><mpath href="#p1"/></animateMotion>)");
}

TEST_F(SmilCompilerTest, MotionInlinePathOptimization) {
    MotionAnimate motion;
    motion.path = "M10.123456,20 L-5.55556 0";
    motion.rotate = MotionRotate{RotateMode::Fixed, 45.0};
    motion.key_points = "0;0.333333;1";
    auto record = makeRecord("move", "dot", motion);

    EXPECT_EQ(compiler.compile(record),
              R"(<animateMotion path="M10.1235,20 L-5.5556 0" rotate="45" keyPoints="0;0.3333;1"/>)");
    EXPECT_EQ(compiler.compile(record, {.optimize = false}),
              R"(<animateMotion path="M10.123456,20 L-5.55556 0" rotate="45" keyPoints="0;0.3333;1"/>)");
}

TEST_F(SmilCompilerTest, SetElement) {
    auto record = makeRecord("hide", "rect", SetAnimate{"visibility"});
    record.to = "hidden";
    record.begin = "1s";
    record.dur = "2s";
    record.fill = FillMode::Freeze;

    EXPECT_EQ(compiler.compile(record), R"(<set attributeName="visibility" to="hidden" begin="1s" dur="2s" fill="freeze"/>)");
}

TEST_F(SmilCompilerTest, AttributeValuesAreEscaped) {
    auto record = makeRecord("label", "text", SetAnimate{"data-label"});
    record.to = R"(a "b" <c> & d)";

    EXPECT_EQ(compiler.compile(record),
              R"(<set attributeName="data-label" to="a &quot;b&quot; &lt;c&gt; &amp; d"/>)");
}

TEST_F(SmilCompilerTest, EmptyValuesAreOmitted) {
    auto record = fade();
    record.begin = "";
    record.values = "";

    EXPECT_EQ(compiler.compile(record),
              R"(<animate attributeName="opacity" from="1" to="0" dur="2s" fill="freeze"/>)");
}

// ============================================================================
// Compile errors
// ============================================================================

TEST_F(SmilCompilerTest, MissingMandatoryFieldsThrow) {
    EXPECT_EQ(compileErrorOf(makeRecord("a", "rect", AttributeAnimate{})), "animate requires attributeName");
    EXPECT_EQ(compileErrorOf(makeRecord("b", "rect", TransformAnimate{})), "animateTransform requires transformType");
    EXPECT_EQ(compileErrorOf(makeRecord("c", "rect", MotionAnimate{})), "animateMotion requires path or mpath");
    EXPECT_EQ(compileErrorOf(makeRecord("d", "rect", SetAnimate{})), "set requires attributeName");
    EXPECT_EQ(compileErrorOf(makeRecord("e", "rect", SetAnimate{"x"})), "set requires a to value");
    EXPECT_EQ(compileErrorOf(makeRecord("f", "rect", CustomAnimate{"bounce"})), "Unknown animation type: bounce");
}

// ============================================================================
// Batch compilation
// ============================================================================

TEST_F(SmilCompilerTest, CompileAllGroupsByTargetAndCollectsWarnings) {
    auto show = makeRecord("show", "rect", SetAnimate{"visibility"});
    show.to = "visible";

    const std::vector<AnimationRecord> records = {
        fade(),
        makeRecord("broken", "circle", AttributeAnimate{}),
        show,
    };

    const auto result = compiler.compileAll(records);
    ASSERT_EQ(result.elements.size(), 2u);
    EXPECT_EQ(result.elements[0].rfind("<animate ", 0), 0u);
    EXPECT_EQ(result.elements[1], R"(<set attributeName="visibility" to="visible"/>)");

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "Failed to compile animation broken: animate requires attributeName");
    EXPECT_TRUE(result.defs.empty());
}

// ============================================================================
// Options
// ============================================================================

TEST_F(SmilCompilerTest, DefaultOptionsAndOverrides) {
    EXPECT_TRUE(compiler.defaultOptions().optimize);
    EXPECT_EQ(compiler.defaultOptions().precision, 4);

    compiler.setDefaultOptions({.precision = 1});
    EXPECT_TRUE(compiler.defaultOptions().optimize);
    EXPECT_EQ(compiler.defaultOptions().precision, 1);

    auto record = makeRecord("x", "rect", AttributeAnimate{"x"});
    record.to = "2.46";
    EXPECT_EQ(compiler.compile(record), R"(<animate attributeName="x" to="2.5"/>)");

    compiler.setDefaultOptions({.precision = 99});
    EXPECT_EQ(compiler.defaultOptions().precision, vecanim::core::param::MAX_COMPILE_PRECISION);
}

TEST_F(SmilCompilerTest, OptionsFromParameters) {
    vecanim::core::param::CompilerParameters params;
    params.optimize = false;
    params.precision = 6;

    const SmilCompiler configured(CompileOptions::fromParameters(params));
    EXPECT_FALSE(configured.defaultOptions().optimize);
    EXPECT_EQ(configured.defaultOptions().precision, 6);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(SmilCompilerTest, ValidRecordPasses) {
    const auto result = compiler.validate(fade());
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(SmilCompilerTest, ValidateReportsMissingBasics) {
    const auto result = compiler.validate(makeRecord("a", "", CustomAnimate{}));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(hasError(result, "Animation type is required"));
    EXPECT_TRUE(hasError(result, "Target element ID is required"));
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(SmilCompilerTest, ValidatePerKind) {
    const auto animate = compiler.validate(makeRecord("a", "rect", AttributeAnimate{}));
    EXPECT_TRUE(hasError(animate, "attributeName is required for animate"));
    EXPECT_TRUE(hasError(animate, "Either from/to or values must be specified"));

    const auto transform = compiler.validate(makeRecord("b", "rect", TransformAnimate{}));
    EXPECT_TRUE(hasError(transform, "transformType is required for animateTransform"));

    const auto motion = compiler.validate(makeRecord("c", "rect", MotionAnimate{}));
    EXPECT_TRUE(hasError(motion, "Either path or mpath is required for animateMotion"));

    const auto set = compiler.validate(makeRecord("d", "rect", SetAnimate{}));
    EXPECT_TRUE(hasError(set, "attributeName is required for set"));
    EXPECT_TRUE(hasError(set, "to value is required for set"));

    const auto custom = compiler.validate(makeRecord("e", "rect", CustomAnimate{"bounce"}));
    EXPECT_TRUE(hasError(custom, "Unsupported animation type: bounce"));
}

TEST_F(SmilCompilerTest, ValidateEasingListLengths) {
    auto record = makeRecord("a", "rect", AttributeAnimate{"x"});
    record.values = "0;50;100";
    record.key_times = "0;1";
    record.calc_mode = CalcMode::Spline;
    record.key_splines = "0 0 1 1";

    const auto result = compiler.validate(record);
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(hasError(result, "keyTimes has 2 entries but values has 3"));
    EXPECT_TRUE(hasError(result, "keySplines has 1 entries but 2 are required"));

    record.key_times = "0;0.5;1";
    record.key_splines = "0 0 1 1;0.42 0 0.58 1";
    EXPECT_TRUE(compiler.validate(record).valid);
}

TEST_F(SmilCompilerTest, SplineModeRequiresKeySplines) {
    auto record = makeRecord("a", "rect", AttributeAnimate{"opacity"});
    record.from = "0";
    record.to = "1";
    record.dur = "1s";
    record.calc_mode = CalcMode::Spline;

    const auto missing = compiler.validate(record);
    EXPECT_FALSE(missing.valid);
    EXPECT_TRUE(hasError(missing, "keySplines is required when calcMode is spline"));

    record.key_splines = "";
    EXPECT_TRUE(hasError(compiler.validate(record), "keySplines is required when calcMode is spline"));

    record.key_splines = "0.42 0 0.58 1";
    EXPECT_TRUE(compiler.validate(record).valid);
}

// ============================================================================
// Number formatting
// ============================================================================

class ValueFormatTest : public ::testing::Test {};

TEST_F(ValueFormatTest, RoundNumber) {
    EXPECT_EQ(roundNumber(1.23456, 4), "1.2346");
    EXPECT_EQ(roundNumber(2.0, 4), "2");
    EXPECT_EQ(roundNumber(-0.00001, 4), "0");
    EXPECT_EQ(roundNumber(100.0, 0), "100");
    EXPECT_EQ(roundNumber(1234.5, 2), "1234.5");
}

TEST_F(ValueFormatTest, RoundNumberNonFinite) {
    EXPECT_EQ(roundNumber(std::numeric_limits<double>::infinity(), 4), "inf");
}

TEST_F(ValueFormatTest, FormatValueKeepsSeparators) {
    EXPECT_EQ(formatValue("10.123456, 20.5", 2), "10.12, 20.5");
    EXPECT_EQ(formatValue("#ff0000", 2), "#ff0000");
}

TEST_F(ValueFormatTest, OptimizePathKeepsCommands) {
    EXPECT_EQ(optimizePath("M0.000001 5 C1.999999,2 3 4", 3), "M0 5 C2,2 3 4");
}

TEST_F(ValueFormatTest, EscapeXml) {
    EXPECT_EQ(escapeXml(R"(<a href="x">&</a>)"), "&lt;a href=&quot;x&quot;&gt;&amp;&lt;/a&gt;");
}
