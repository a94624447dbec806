#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <array>
#include <optional>

namespace dmesg {

enum class LogCategory {
    Critical,
    Error,
    Warning,
    Info
};

// Order in which rules are evaluated. The first matching rule wins, so the
// worst severity always takes precedence.
constexpr std::array<LogCategory, 4> kCategoryPriority = {
    LogCategory::Critical,
    LogCategory::Error,
    LogCategory::Warning,
    LogCategory::Info
};

struct Rule
{
    QStringList keywords;
    QString     color;
    QString     icon;
};

struct RuleSet
{
    Rule critical;
    Rule error;
    Rule warning;
    Rule info;

    Rule &rule(LogCategory category);
    const Rule &rule(LogCategory category) const;
};

// Name of the category's top-level key in a rule document.
QString categoryToString(LogCategory c);

// JSON helpers
//
// A rule document is an object with the keys "critical", "error",
// "warning" and "info", each holding {"keywords": [...], "color": "...",
// "icon": "..."}. Unknown keys are ignored. Returns std::nullopt if the
// text is not valid JSON or any required field is missing or mistyped;
// errorString then names the offending key.
std::optional<RuleSet> ruleSetFromJson(const QByteArray &text,
                                       QString *errorString = nullptr);

QJsonObject ruleToJson(const Rule &rule);
QJsonObject ruleSetToJson(const RuleSet &rules);

} // namespace dmesg
