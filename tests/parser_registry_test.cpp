#include <gtest/gtest.h>

#include "parser_registry.hpp"
#include "test_support.hpp"

using namespace testing_support;

namespace {

class NamelessParser : public ScriptedParser {
public:
    NamelessParser() : ScriptedParser("", {Signature(0, std::string("X"))}) {}
};

TEST(ParserTable, RejectsBadDeclarations) {
    std::vector<std::unique_ptr<BaseParser>> parsers;
    parsers.push_back(scripted("good", "GO"));
    parsers.push_back(std::make_unique<NamelessParser>());
    parsers.push_back(scripted("good", "G2"));
    parsers.push_back(std::make_unique<ScriptedParser>("hollow", std::vector<Signature>{Signature(3, std::vector<uint8_t>{})}));
    parsers.push_back(nullptr);
    parsers.push_back(std::make_unique<ScriptedParser>("fallback", std::vector<Signature>{}));

    auto table = ParserTable::build(std::move(parsers));

    EXPECT_EQ(table->variantNames(), (std::vector<std::string>{"good", "fallback"}));
    ASSERT_EQ(table->rejected().size(), 4u);
    EXPECT_EQ(table->rejected()[0].reason, "empty name");
    EXPECT_EQ(table->rejected()[1].reason, "duplicate name");
    EXPECT_EQ(table->rejected()[2].name, "hollow");
    EXPECT_EQ(table->rejected()[3].reason, "null parser");
    EXPECT_EQ(table->index().fallbacks(), (std::vector<size_t>{1}));
}

TEST(ParserRegistry, FrozenTableIsOrderedByPriorityThenName) {
    auto table = ParserRegistry::instance().freeze();
    const auto& names = table->variantNames();
    ASSERT_GE(names.size(), 11u);

    EXPECT_EQ(names.front(), "androidboothuawei");
    EXPECT_EQ(names.back(), "mbr");
    EXPECT_LT(registeredVariant("uimage"), registeredVariant("gzip"));
    EXPECT_LT(registeredVariant("gzip"), registeredVariant("xz"));
    EXPECT_LT(registeredVariant("cpio"), registeredVariant("tar"));
    EXPECT_LT(registeredVariant("tar"), registeredVariant("zip"));
    EXPECT_LT(registeredVariant("bmp"), registeredVariant("png"));
    EXPECT_TRUE(table->rejected().empty());
}

TEST(ParserRegistry, FreezeIsIdempotentAndFinal) {
    auto first = ParserRegistry::instance().freeze();
    auto second = ParserRegistry::instance().freeze();
    EXPECT_EQ(first, second);
    EXPECT_TRUE(ParserRegistry::instance().frozen());
    EXPECT_THROW(ParserRegistry::instance().registerParser(0, [] { return scripted("late", "LT"); }),
                 std::logic_error);
}

} // namespace
