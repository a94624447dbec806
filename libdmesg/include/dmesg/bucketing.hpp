#pragma once

#include <QStringList>

#include "dmesg/rules.hpp"

namespace dmesg {

// Lines partitioned by category. Each list keeps input order.
struct Buckets
{
    QStringList critical;
    QStringList error;
    QStringList warning;
    QStringList info;

    QStringList &bucket(LogCategory category);
    const QStringList &bucket(LogCategory category) const;

    qsizetype totalLines() const;
};

// Classifies every line once, in order. Matched lines land decorated in
// their category's bucket; unmatched lines go to info unchanged.
Buckets bucketLines(const QStringList &lines, const RuleSet &rules);

} // namespace dmesg
