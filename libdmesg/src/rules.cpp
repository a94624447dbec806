#include "dmesg/rules.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace dmesg {

namespace {

void setError(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}

std::optional<Rule> ruleFromJson(const QJsonObject &obj,
                                 const QString &name,
                                 QString *errorString)
{
    const QJsonValue keywordsVal = obj.value(QStringLiteral("keywords"));
    if (!keywordsVal.isArray()) {
        setError(errorString,
                 QStringLiteral("%1.keywords: expected an array of strings").arg(name));
        return std::nullopt;
    }

    Rule rule;

    const QJsonArray keywords = keywordsVal.toArray();
    rule.keywords.reserve(keywords.size());
    for (const QJsonValue &kw : keywords) {
        if (!kw.isString()) {
            setError(errorString,
                     QStringLiteral("%1.keywords: every keyword must be a string").arg(name));
            return std::nullopt;
        }
        rule.keywords.push_back(kw.toString());
    }

    const QJsonValue colorVal = obj.value(QStringLiteral("color"));
    if (!colorVal.isString()) {
        setError(errorString,
                 QStringLiteral("%1.color: expected a string").arg(name));
        return std::nullopt;
    }
    rule.color = colorVal.toString();

    const QJsonValue iconVal = obj.value(QStringLiteral("icon"));
    if (!iconVal.isString()) {
        setError(errorString,
                 QStringLiteral("%1.icon: expected a string").arg(name));
        return std::nullopt;
    }
    rule.icon = iconVal.toString();

    return rule;
}

} // namespace

const Rule &RuleSet::rule(LogCategory category) const
{
    switch (category) {
    case LogCategory::Critical:
        return critical;
    case LogCategory::Error:
        return error;
    case LogCategory::Warning:
        return warning;
    case LogCategory::Info:
        return info;
    }

    return info;
}

Rule &RuleSet::rule(LogCategory category)
{
    switch (category) {
    case LogCategory::Critical:
        return critical;
    case LogCategory::Error:
        return error;
    case LogCategory::Warning:
        return warning;
    case LogCategory::Info:
        return info;
    }

    return info;
}

QString categoryToString(LogCategory c)
{
    switch (c) {
    case LogCategory::Critical:
        return QStringLiteral("critical");
    case LogCategory::Error:
        return QStringLiteral("error");
    case LogCategory::Warning:
        return QStringLiteral("warning");
    case LogCategory::Info:
        return QStringLiteral("info");
    }

    return QStringLiteral("info");
}

std::optional<RuleSet> ruleSetFromJson(const QByteArray &text, QString *errorString)
{
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(text, &err);
    if (err.error != QJsonParseError::NoError) {
        setError(errorString,
                 QStringLiteral("parse error at offset %1: %2")
                     .arg(err.offset)
                     .arg(err.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(errorString, QStringLiteral("top level must be an object"));
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    RuleSet rules;

    // All four rules are required; a partial document is rejected whole.
    for (LogCategory category : kCategoryPriority) {
        const QString name = categoryToString(category);
        const QJsonValue value = root.value(name);
        if (!value.isObject()) {
            setError(errorString,
                     value.isUndefined()
                         ? QStringLiteral("missing rule \"%1\"").arg(name)
                         : QStringLiteral("%1: expected an object").arg(name));
            return std::nullopt;
        }

        std::optional<Rule> rule = ruleFromJson(value.toObject(), name, errorString);
        if (!rule) {
            return std::nullopt;
        }
        rules.rule(category) = std::move(*rule);
    }

    return rules;
}

QJsonObject ruleToJson(const Rule &rule)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("keywords"), QJsonArray::fromStringList(rule.keywords));
    obj.insert(QStringLiteral("color"), rule.color);
    obj.insert(QStringLiteral("icon"), rule.icon);
    return obj;
}

QJsonObject ruleSetToJson(const RuleSet &rules)
{
    QJsonObject obj;
    for (LogCategory category : kCategoryPriority) {
        obj.insert(categoryToString(category), ruleToJson(rules.rule(category)));
    }
    return obj;
}

} // namespace dmesg
