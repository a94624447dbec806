#include <gtest/gtest.h>

#include "dmesg/classifier.hpp"
#include "dmesg/decorator.hpp"

#include "test_support.hpp"

using dmesg::LogCategory;
using dmesg::RuleSet;
using dmesg::classifyLine;
using dmesg::matchesRule;
using dmesg::test::makeRule;

TEST(MatchesRule, IgnoresCase)
{
    const auto rule = makeRule({QStringLiteral("panic")});
    EXPECT_TRUE(matchesRule(QStringLiteral("KERNEL PANIC - not syncing"), rule));
    EXPECT_TRUE(matchesRule(QStringLiteral("Kernel Panic"), rule));

    const auto upperRule = makeRule({QStringLiteral("OOPS")});
    EXPECT_TRUE(matchesRule(QStringLiteral("kernel: oops: 0000"), upperRule));
}

TEST(MatchesRule, UsesSubstringSemantics)
{
    const auto rule = makeRule({QStringLiteral("fail")});
    EXPECT_TRUE(matchesRule(QStringLiteral("systemd: Failed to start unit"), rule));
    EXPECT_FALSE(matchesRule(QStringLiteral("fa il"), rule));
}

TEST(MatchesRule, AnyKeywordIsEnough)
{
    const auto rule = makeRule({QStringLiteral("alpha"), QStringLiteral("beta")});
    EXPECT_TRUE(matchesRule(QStringLiteral("...beta..."), rule));
    EXPECT_FALSE(matchesRule(QStringLiteral("gamma"), rule));
}

TEST(MatchesRule, EmptyKeywordListNeverMatches)
{
    const auto rule = makeRule({});
    EXPECT_FALSE(matchesRule(QString(), rule));
    EXPECT_FALSE(matchesRule(QStringLiteral(""), rule));
    EXPECT_FALSE(matchesRule(QStringLiteral("anything at all"), rule));
}

TEST(MatchesRule, EmptyKeywordMatchesEveryLine)
{
    const auto rule = makeRule({QStringLiteral("")});
    EXPECT_TRUE(matchesRule(QStringLiteral("usb 1-1: new device"), rule));
    EXPECT_TRUE(matchesRule(QStringLiteral(""), rule));
    EXPECT_TRUE(matchesRule(QString(), rule));
}

TEST(ClassifyLine, EmptyKeywordActsAsCatchAll)
{
    RuleSet rules = dmesg::test::scenarioRules();
    rules.info = makeRule({QStringLiteral("")}, QStringLiteral("green"), QStringLiteral("i"));

    const auto classified = classifyLine(QStringLiteral("usb 1-1: new device"), rules);
    ASSERT_TRUE(classified.has_value());
    EXPECT_EQ(classified->category, LogCategory::Info);
    EXPECT_EQ(classified->decoratedText,
              QStringLiteral("i \x1b[32musb 1-1: new device\x1b[0m"));

    // A more severe rule still wins over the catch-all.
    const auto severe = classifyLine(QStringLiteral("Oops: 0000"), rules);
    ASSERT_TRUE(severe.has_value());
    EXPECT_EQ(severe->category, LogCategory::Critical);
}

TEST(ClassifyLine, ReturnsNothingWhenNoRuleMatches)
{
    const RuleSet rules = dmesg::test::scenarioRules();
    EXPECT_FALSE(classifyLine(QStringLiteral("usb 1-1: new device"), rules).has_value());
    EXPECT_FALSE(classifyLine(QString(), rules).has_value());
}

TEST(ClassifyLine, WorstSeverityWins)
{
    RuleSet rules;
    rules.critical = makeRule({QStringLiteral("panic")}, QStringLiteral("bold red"), QStringLiteral("C"));
    rules.error = makeRule({QStringLiteral("error")}, QStringLiteral("red"), QStringLiteral("E"));
    rules.warning = makeRule({QStringLiteral("warn")}, QStringLiteral("yellow"), QStringLiteral("W"));
    rules.info = makeRule({QStringLiteral("kernel")}, QStringLiteral("green"), QStringLiteral("I"));

    const QString all = QStringLiteral("kernel: warn then error then panic");
    auto result = classifyLine(all, rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->category, LogCategory::Critical);

    result = classifyLine(QStringLiteral("kernel: warn then error"), rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->category, LogCategory::Error);

    result = classifyLine(QStringLiteral("kernel: warn"), rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->category, LogCategory::Warning);

    result = classifyLine(QStringLiteral("kernel: hello"), rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->category, LogCategory::Info);
}

TEST(ClassifyLine, PriorityIgnoresKeywordOverlapBetweenRules)
{
    // The same keyword in two rules: the more severe rule always wins.
    RuleSet rules = dmesg::test::scenarioRules();
    rules.warning.keywords << QStringLiteral("oops");

    const auto result = classifyLine(QStringLiteral("Oops happened"), rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->category, LogCategory::Critical);
}

TEST(ClassifyLine, DecoratesWithMatchingRule)
{
    const RuleSet rules = dmesg::test::scenarioRules();
    const QString line = QStringLiteral("eth0: link down (warn)");

    const auto result = classifyLine(line, rules);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->category, LogCategory::Warning);
    EXPECT_EQ(result->decoratedText,
              dmesg::decorateLine(line, rules.warning.color, rules.warning.icon));
}

TEST(ClassifyLine, EmptyRulesMatchNothing)
{
    RuleSet rules;
    EXPECT_FALSE(classifyLine(QStringLiteral("kernel panic"), rules).has_value());
    EXPECT_FALSE(classifyLine(QString(), rules).has_value());
}
