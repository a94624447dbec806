#include "viewer.hpp"

#include <QDebug>
#include <QTextStream>

#include <cstdio>
#include <utility>

namespace dmesg {

namespace {

void say(const QString &message)
{
    QTextStream out(stdout);
    out << message << '\n';
    out.flush();
}

} // namespace

Viewer::Viewer(Buckets buckets, Pager pager)
    : buckets_(std::move(buckets))
    , pager_(std::move(pager))
{
}

QStringList Viewer::menuLabels(const Buckets &buckets)
{
    return {
        QStringLiteral("🔥 Criticals (%1)").arg(buckets.critical.size()),
        QStringLiteral("❌ Errors (%1)").arg(buckets.error.size()),
        QStringLiteral("⚠️  Warnings (%1)").arg(buckets.warning.size()),
        QStringLiteral("ℹ️  Ok (%1)").arg(buckets.info.size()),
        QStringLiteral("🚪 Exit"),
    };
}

LogCategory Viewer::categoryForEntry(Entry entry)
{
    switch (entry) {
    case CriticalEntry:
        return LogCategory::Critical;
    case ErrorEntry:
        return LogCategory::Error;
    case WarningEntry:
        return LogCategory::Warning;
    case InfoEntry:
    case ExitEntry:
        break;
    }
    return LogCategory::Info;
}

QString Viewer::sectionText(const QStringList &lines)
{
    return lines.join(QLatin1Char('\n'));
}

int Viewer::run()
{
    if (!menu_.open()) {
        qWarning() << "Viewer: no interactive terminal; printing all sections";
        printAllSections();
        return 0;
    }

    const QString title = QStringLiteral("✔ Choose a section to view:");
    const QString help = QStringLiteral("Use arrows ↑↓ and press Enter. Press Esc to quit.");

    while (true) {
        const std::optional<int> choice = menu_.prompt(title, menuLabels(buckets_), help);

        if (!choice.has_value()) {
            menu_.close();
            say(QStringLiteral("Exited via Esc or input error."));
            return 0;
        }

        const auto entry = static_cast<Entry>(*choice);
        if (entry == ExitEntry) {
            menu_.close();
            say(QStringLiteral("Exiting..."));
            return 0;
        }

        menu_.suspend();
        if (!showSection(entry)) {
            menu_.waitForKey(QStringLiteral("\nPress Enter to return to the menu."));
        }
    }
}

bool Viewer::showSection(Entry entry)
{
    return pager_.show(sectionText(buckets_.bucket(categoryForEntry(entry))));
}

void Viewer::printAllSections() const
{
    const QStringList labels = menuLabels(buckets_);

    for (int i = CriticalEntry; i <= InfoEntry; ++i) {
        const auto entry = static_cast<Entry>(i);
        const QStringList &lines = buckets_.bucket(categoryForEntry(entry));

        say(QStringLiteral("== %1 ==").arg(labels.at(i)));
        if (!lines.isEmpty()) {
            Pager::printDirect(sectionText(lines));
        }
    }
}

} // namespace dmesg
