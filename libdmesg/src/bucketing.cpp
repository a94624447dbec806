#include "dmesg/bucketing.hpp"

#include "dmesg/classifier.hpp"

namespace dmesg {

QStringList &Buckets::bucket(LogCategory category)
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

const QStringList &Buckets::bucket(LogCategory category) const
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

qsizetype Buckets::totalLines() const
{
    return critical.size() + error.size() + warning.size() + info.size();
}

Buckets bucketLines(const QStringList &lines, const RuleSet &rules)
{
    Buckets buckets;

    for (const QString &line : lines) {
        std::optional<ClassifiedLine> classified = classifyLine(line, rules);
        if (classified) {
            buckets.bucket(classified->category).push_back(std::move(classified->decoratedText));
        } else {
            buckets.info.push_back(line);
        }
    }

    return buckets;
}

} // namespace dmesg
