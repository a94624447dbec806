#pragma once

#include <QString>
#include <QStringList>

#include <cstdio>
#include <optional>

// ncurses types; the header itself defines macros (OK, ERR, ...) we keep
// out of the rest of the program.
struct screen;

namespace dmesg {

// Single-choice menu drawn with ncurses on the controlling terminal.
// The terminal is opened on /dev/tty so the menu keeps working when the
// log itself arrives on stdin.
class SectionMenu
{
public:
    SectionMenu() = default;
    ~SectionMenu();

    SectionMenu(const SectionMenu &) = delete;
    SectionMenu &operator=(const SectionMenu &) = delete;

    // Returns false if no terminal is available.
    bool open();
    void close();
    bool isOpen() const { return screen_ != nullptr; }

    // Shows the entries and blocks until one is chosen. Returns its index,
    // or std::nullopt if the user cancelled (Esc, q, end of input).
    std::optional<int> prompt(const QString &title,
                              const QStringList &entries,
                              const QString &help);

    // Hands the terminal back to the shell, e.g. while a pager runs. The
    // next prompt() takes it over again.
    void suspend();

    // While suspended, prints message on the terminal and blocks until the
    // user presses Enter, so output written in the meantime stays visible.
    void waitForKey(const QString &message);

private:
    void draw(const QString &title,
              const QStringList &entries,
              const QString &help,
              int selected) const;

    std::FILE *ttyIn_ = nullptr;
    std::FILE *ttyOut_ = nullptr;
    screen *screen_ = nullptr;
    bool suspended_ = false;
    bool hasColors_ = false;
};

} // namespace dmesg
