#pragma once

#include <QString>

#include <ostream>

#include "dmesg/rules.hpp"

// Readable QString values in gtest failure messages.
QT_BEGIN_NAMESPACE
inline void PrintTo(const QString &value, std::ostream *os)
{
    *os << '"' << value.toStdString() << '"';
}
QT_END_NAMESPACE

namespace dmesg {
namespace test {

inline Rule makeRule(const QStringList &keywords,
                     const QString &color = QStringLiteral("red"),
                     const QString &icon = QStringLiteral("*"))
{
    Rule rule;
    rule.keywords = keywords;
    rule.color = color;
    rule.icon = icon;
    return rule;
}

// critical=oops, error=failed, warning=warn, info=<none>
inline RuleSet scenarioRules()
{
    RuleSet rules;
    rules.critical = makeRule({QStringLiteral("oops")}, QStringLiteral("bold red"), QStringLiteral("🔥"));
    rules.error = makeRule({QStringLiteral("failed")}, QStringLiteral("red"), QStringLiteral("❌"));
    rules.warning = makeRule({QStringLiteral("warn")}, QStringLiteral("yellow"), QStringLiteral("⚠️"));
    rules.info = makeRule({}, QStringLiteral("green"), QStringLiteral("ℹ️"));
    return rules;
}

} // namespace test
} // namespace dmesg
