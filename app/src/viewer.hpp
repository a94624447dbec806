#pragma once

#include <QString>
#include <QStringList>

#include "dmesg/bucketing.hpp"

#include "pager.hpp"
#include "section_menu.hpp"

namespace dmesg {

// Interactive browser over the four buckets: pick one from the menu, read
// it in the pager, come back to the menu.
class Viewer
{
public:
    // Menu positions. Sections come first, in severity order.
    enum Entry {
        CriticalEntry = 0,
        ErrorEntry,
        WarningEntry,
        InfoEntry,
        ExitEntry
    };

    explicit Viewer(Buckets buckets, Pager pager = Pager());

    // Runs until the user exits or cancels. Returns the process exit code.
    int run();

    // Pages the bucket behind a section entry. Returns false if the pager
    // could not run and the text was printed directly instead.
    bool showSection(Entry entry);

    static QStringList menuLabels(const Buckets &buckets);
    static LogCategory categoryForEntry(Entry entry);

    // Bucket text as handed to the pager.
    static QString sectionText(const QStringList &lines);

private:
    void printAllSections() const;

    Buckets buckets_;
    Pager pager_;
    SectionMenu menu_;
};

} // namespace dmesg
