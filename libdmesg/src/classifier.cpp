#include "dmesg/classifier.hpp"

#include "dmesg/decorator.hpp"

namespace dmesg {

bool matchesRule(const QString &line, const Rule &rule)
{
    for (const QString &keyword : rule.keywords) {
        if (line.contains(keyword, Qt::CaseInsensitive)) {
            return true;
        }
    }

    return false;
}

std::optional<ClassifiedLine> classifyLine(const QString &line, const RuleSet &rules)
{
    for (LogCategory category : kCategoryPriority) {
        const Rule &rule = rules.rule(category);
        if (!matchesRule(line, rule)) {
            continue;
        }

        ClassifiedLine classified;
        classified.decoratedText = decorateLine(line, rule.color, rule.icon);
        classified.category = category;
        return classified;
    }

    return std::nullopt;
}

} // namespace dmesg
