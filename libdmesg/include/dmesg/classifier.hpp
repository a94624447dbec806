#pragma once

#include <QString>

#include <optional>

#include "dmesg/rules.hpp"

namespace dmesg {

struct ClassifiedLine
{
    QString     decoratedText;
    LogCategory category = LogCategory::Info;
};

// True if any keyword of the rule occurs in the line, ignoring case.
// A rule without keywords never matches; an empty keyword matches every
// line.
bool matchesRule(const QString &line, const Rule &rule);

// Checks the rules in kCategoryPriority order and decorates the line with
// the first one that matches. Returns std::nullopt if none does.
std::optional<ClassifiedLine> classifyLine(const QString &line, const RuleSet &rules);

} // namespace dmesg
