// File: tests/unit/BuiltinRegistryTests.cpp
// Purpose: Validate builtin registry construction, lookup and call checking.
// Key invariants: A variant-dependent builtin has exactly one Float and one
//                 FixedPoint member; construction fails on the first violation.
// Ownership/Lifetime: Each test builds its own registry from literal rows.
// Links: src/il/builtins/BuiltinRegistry.hpp

#include "il/builtins/BuiltinCatalog.hpp"
#include "il/builtins/BuiltinRegistry.hpp"
#include "il/builtins/BuiltinSignatureParser.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace il::builtins;
using qshade::diag::FixedDiag;

namespace
{

BuiltinImplDecl decl(const char *proto,
                     std::optional<BuiltinVariant> variant,
                     const char *symbol,
                     const char *site)
{
    auto sig = parseBuiltinPrototype(proto);
    EXPECT_TRUE(sig.hasValue()) << proto;
    BuiltinImplDecl d;
    d.signature = sig.value();
    d.variant = variant;
    d.symbol = symbol;
    d.site = site;
    return d;
}

constexpr auto kFloat = BuiltinVariant::Float;
constexpr auto kFixed = BuiltinVariant::FixedPoint;

} // namespace

TEST(BuiltinRegistry, AcceptsCompletePairsAndUntaggedHelpers)
{
    auto reg = BuiltinRegistry::create({
        decl("float sin(float x)", kFloat, "sin_f", "a:1"),
        decl("float sin(float x)", kFixed, "sin_q", "a:2"),
        decl("uint hash(uint x)", std::nullopt, "hash_u", "a:3"),
    });
    ASSERT_TRUE(reg.hasValue()) << reg.error().message;
    ASSERT_EQ(reg.value().descriptors().size(), 2u);

    const auto *sin = reg.value().find("sin", {GlslType::Float});
    ASSERT_NE(sin, nullptr);
    EXPECT_TRUE(sin->variantDependent);
    EXPECT_EQ(reg.value().implementationFor(*sin, kFloat)->symbol, "sin_f");
    EXPECT_EQ(reg.value().implementationFor(*sin, kFixed)->symbol, "sin_q");

    const auto *hash = reg.value().find("hash", {GlslType::UInt});
    ASSERT_NE(hash, nullptr);
    EXPECT_FALSE(hash->variantDependent);
    EXPECT_EQ(reg.value().implementationFor(*hash, kFloat)->symbol, "hash_u");
    EXPECT_EQ(reg.value().implementationFor(*hash, kFixed)->symbol, "hash_u");
}

TEST(BuiltinRegistry, FindRequiresExactArgumentTypes)
{
    auto reg = BuiltinRegistry::create({
        decl("float sin(float x)", kFloat, "sin_f", "a:1"),
        decl("float sin(float x)", kFixed, "sin_q", "a:2"),
    });
    ASSERT_TRUE(reg.hasValue());
    EXPECT_EQ(reg.value().find("sin", {GlslType::Vec2}), nullptr);
    EXPECT_EQ(reg.value().find("sin", {}), nullptr);
    EXPECT_EQ(reg.value().find("cos", {GlslType::Float}), nullptr);
}

TEST(BuiltinRegistry, FindBySymbolReturnsOwningDescriptor)
{
    auto reg = BuiltinRegistry::create({
        decl("vec3 hue(float h)", kFloat, "hue_f", "a:1"),
        decl("vec3 hue(float h)", kFixed, "hue_q", "a:2"),
    });
    ASSERT_TRUE(reg.hasValue());
    auto hit = reg.value().findBySymbol("hue_q");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->descriptor->signature.name, "hue");
    EXPECT_EQ(hit->impl->variant, kFixed);
    EXPECT_FALSE(reg.value().findBySymbol("hue").has_value());
}

TEST(BuiltinRegistry, MissingFixedVariant)
{
    auto reg = BuiltinRegistry::create({decl("float sin(float x)", kFloat, "sin_f", "a:1")});
    ASSERT_FALSE(reg.hasValue());
    EXPECT_EQ(reg.error().kind, FixedDiag::MissingBuiltinVariant);
    EXPECT_EQ(reg.error().code(), "E-FX003");
    EXPECT_EQ(reg.error().builtin, "sin");
    EXPECT_EQ(reg.error().subjects, (std::vector<std::string>{"FixedPoint", "Float"}));
    EXPECT_EQ(reg.error().message, "builtin 'sin' has no FixedPoint implementation (declared: Float)");
}

TEST(BuiltinRegistry, MissingFloatVariant)
{
    auto reg = BuiltinRegistry::create({decl("float sin(float x)", kFixed, "sin_q", "a:1")});
    ASSERT_FALSE(reg.hasValue());
    EXPECT_EQ(reg.error().kind, FixedDiag::MissingBuiltinVariant);
    EXPECT_EQ(reg.error().subjects.front(), "Float");
}

TEST(BuiltinRegistry, DuplicateVariantNamesBothSites)
{
    auto reg = BuiltinRegistry::create({
        decl("float sin(float x)", kFloat, "sin_f", "a:1"),
        decl("float sin(float x)", kFixed, "sin_q", "a:2"),
        decl("float sin(float x)", kFixed, "sin_q2", "a:3"),
    });
    ASSERT_FALSE(reg.hasValue());
    EXPECT_EQ(reg.error().kind, FixedDiag::DuplicateBuiltinVariant);
    EXPECT_EQ(reg.error().subjects, (std::vector<std::string>{"FixedPoint", "a:2", "a:3"}));
    EXPECT_NE(reg.error().message.find("a:2 and a:3"), std::string::npos);
}

TEST(BuiltinRegistry, UntaggedMemberCannotJoinTaggedOnes)
{
    auto reg = BuiltinRegistry::create({
        decl("float sin(float x)", std::nullopt, "sin_any", "a:1"),
        decl("float sin(float x)", kFloat, "sin_f", "a:2"),
    });
    ASSERT_FALSE(reg.hasValue());
    EXPECT_EQ(reg.error().kind, FixedDiag::DuplicateBuiltinVariant);
    EXPECT_EQ(reg.error().subjects.front(), "Any");
}

TEST(BuiltinRegistry, VariantsWithDifferentShapesMismatch)
{
    auto reg = BuiltinRegistry::create({
        decl("vec2 rot(vec2 p, float a)", kFloat, "rot_f", "a:1"),
        decl("vec2 rot(vec2 p)", kFixed, "rot_q", "a:2"),
    });
    ASSERT_FALSE(reg.hasValue());
    EXPECT_EQ(reg.error().kind, FixedDiag::BuiltinSignatureMismatch);
    EXPECT_EQ(reg.error().code(), "E-FX005");
    EXPECT_EQ(reg.error().subjects,
              (std::vector<std::string>{"vec2 rot(in vec2 p, in float a)", "vec2 rot(in vec2 p)"}));
}

TEST(BuiltinRegistry, OverloadsWithBothVariantsAreIndependent)
{
    auto reg = BuiltinRegistry::create({
        decl("float mix(float a, float b)", kFloat, "mix1_f", "a:1"),
        decl("float mix(float a, float b)", kFixed, "mix1_q", "a:2"),
        decl("vec2 mix(vec2 a, vec2 b)", kFloat, "mix2_f", "a:3"),
        decl("vec2 mix(vec2 a, vec2 b)", kFixed, "mix2_q", "a:4"),
    });
    ASSERT_TRUE(reg.hasValue()) << reg.error().message;
    EXPECT_EQ(reg.value().descriptors().size(), 2u);
    EXPECT_NE(reg.value().find("mix", {GlslType::Vec2, GlslType::Vec2}), nullptr);
}

TEST(BuiltinRegistry, CheckCallReportsMismatches)
{
    auto reg = BuiltinRegistry::create({
        decl("vec3 hsv(vec3 c)", kFloat, "hsv_f", "a:1"),
        decl("vec3 hsv(vec3 c)", kFixed, "hsv_q", "a:2"),
    });
    ASSERT_TRUE(reg.hasValue());
    const auto &r = reg.value();

    auto ok = r.checkCall("hsv", {GlslType::Vec3});
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), GlslType::Vec3);

    auto unknown = r.checkCall("nope", {});
    ASSERT_FALSE(unknown.hasValue());
    EXPECT_EQ(unknown.error().message, "unknown builtin function: nope");

    auto arity = r.checkCall("hsv", {GlslType::Vec3, GlslType::Float});
    ASSERT_FALSE(arity.hasValue());
    EXPECT_EQ(arity.error().message, "function `hsv` expects 1 arguments, got 2");

    auto scalar = r.checkCall("hsv", {GlslType::Float});
    ASSERT_FALSE(scalar.hasValue());
    EXPECT_EQ(scalar.error().message, "function `hsv` parameter `c` expects vector type `vec3`, got scalar `float`");
}

TEST(BuiltinRegistry, FlattenExpandsLanesPerVariant)
{
    auto sig = parseBuiltinPrototype("vec3 f(vec2 p, inout float acc, uint n)");
    ASSERT_TRUE(sig.hasValue());
    using K = il::core::Type::Kind;

    const auto flt = flattenToIl(sig.value(), kFloat);
    ASSERT_EQ(flt.params.size(), 4u);
    EXPECT_EQ(flt.params[0].type.kind, K::F32);
    EXPECT_EQ(flt.params[1].type.kind, K::F32);
    EXPECT_EQ(flt.params[2].type.kind, K::Ptr);
    EXPECT_EQ(flt.params[3].type.kind, K::I32);
    ASSERT_EQ(flt.returns.size(), 3u);
    EXPECT_EQ(flt.returns[0].type.kind, K::F32);

    const auto fix = flattenToIl(sig.value(), kFixed);
    EXPECT_EQ(fix.params[0].type.kind, K::I32);
    EXPECT_EQ(fix.returns[2].type.kind, K::I32);
}

TEST(BuiltinRegistry, DefaultCatalogIsValid)
{
    const auto &reg = defaultBuiltinRegistry();
    ASSERT_TRUE(reg.hasValue()) << reg.error().message;
    for (const auto &desc : reg.value().descriptors())
    {
        for (auto v : {kFloat, kFixed})
        {
            const auto *impl = reg.value().implementationFor(desc, v);
            ASSERT_NE(impl, nullptr) << desc.signature.name;
            EXPECT_NE(impl->address, nullptr);
            EXPECT_NE(impl->handler, nullptr);
        }
    }
    EXPECT_NE(reg.value().find("lpfx_hue2rgb", {GlslType::Float}), nullptr);
    EXPECT_TRUE(reg.value().findBySymbol("qs_sin_q32").has_value());

    // vec3 and vec4 overloads resolve to distinct descriptors.
    for (const char *name : {"lpfx_hsv2rgb", "lpfx_rgb2hsv"})
    {
        const auto *vec3 = reg.value().find(name, {GlslType::Vec3});
        const auto *vec4 = reg.value().find(name, {GlslType::Vec4});
        ASSERT_NE(vec3, nullptr) << name;
        ASSERT_NE(vec4, nullptr) << name;
        EXPECT_NE(vec3, vec4) << name;
        EXPECT_EQ(vec3->signature.returnType, GlslType::Vec3);
        EXPECT_EQ(vec4->signature.returnType, GlslType::Vec4);
    }
    const auto *hsv4 = reg.value().find("lpfx_hsv2rgb", {GlslType::Vec4});
    ASSERT_NE(hsv4, nullptr);
    EXPECT_EQ(reg.value().implementationFor(*hsv4, kFixed)->symbol, "qs_hsv2rgb_vec4_q32");
    const auto *hsv3 = reg.value().find("lpfx_hsv2rgb", {GlslType::Vec3});
    ASSERT_NE(hsv3, nullptr);
    EXPECT_EQ(reg.value().implementationFor(*hsv3, kFixed)->symbol, "qs_hsv2rgb_q32");
    EXPECT_EQ(flattenToIl(hsv4->signature, kFixed).returns.size(), 4u);
}

TEST(BuiltinRegistry, DefaultCatalogSitesPointIntoTheTable)
{
    auto decls = builtinCatalog();
    ASSERT_TRUE(decls.hasValue());
    ASSERT_FALSE(decls.value().empty());
    for (const auto &d : decls.value())
        EXPECT_EQ(d.site.rfind("Builtins.def:", 0), 0u) << d.site;
}
