#pragma once

#include <QString>
#include <QStringList>

namespace dmesg {

// Shows text through an external pager (less -R by default so ANSI colors
// survive). Falls back to writing straight to stdout if the pager cannot
// be launched.
class Pager
{
public:
    explicit Pager(QString program = QStringLiteral("less"),
                   QStringList arguments = {QStringLiteral("-R")});

    // Returns true if the pager displayed the content, false if it had to
    // be printed directly.
    bool show(const QString &content);

    static void printDirect(const QString &content);

private:
    QString program_;
    QStringList arguments_;
};

} // namespace dmesg
