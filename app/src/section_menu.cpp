#include "section_menu.hpp"

#include <QDebug>

#include <clocale>

#include <ncurses.h>

namespace dmesg {

namespace {

constexpr int kKeyEscape   = 27;
constexpr int kEscDelayMs  = 25;
constexpr int kFirstRow    = 3;

enum {
    CP_TITLE = 1,
    CP_SELECTED,
    CP_HELP
};

void setupColors()
{
    start_color();
    use_default_colors();
    init_pair(CP_TITLE, COLOR_GREEN, -1);
    init_pair(CP_SELECTED, COLOR_CYAN, -1);
    init_pair(CP_HELP, COLOR_WHITE, -1);
}

} // namespace

SectionMenu::~SectionMenu()
{
    close();
}

bool SectionMenu::open()
{
    if (screen_) {
        return true;
    }

    std::setlocale(LC_ALL, "");

    ttyIn_ = std::fopen("/dev/tty", "r");
    ttyOut_ = std::fopen("/dev/tty", "w");
    if (!ttyIn_ || !ttyOut_) {
        qWarning() << "SectionMenu: cannot open /dev/tty";
        close();
        return false;
    }

    screen_ = newterm(nullptr, ttyOut_, ttyIn_);
    if (!screen_) {
        qWarning() << "SectionMenu: terminal type not supported";
        close();
        return false;
    }

    set_term(screen_);
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(kEscDelayMs);
    curs_set(0);

    hasColors_ = has_colors();
    if (hasColors_) {
        setupColors();
    }

    suspended_ = false;
    return true;
}

void SectionMenu::close()
{
    if (screen_) {
        if (!suspended_) {
            endwin();
        }
        delscreen(screen_);
        screen_ = nullptr;
    }
    if (ttyIn_) {
        std::fclose(ttyIn_);
        ttyIn_ = nullptr;
    }
    if (ttyOut_) {
        std::fclose(ttyOut_);
        ttyOut_ = nullptr;
    }
    suspended_ = false;
}

void SectionMenu::suspend()
{
    if (!screen_ || suspended_) {
        return;
    }
    def_prog_mode();
    endwin();
    suspended_ = true;
}

void SectionMenu::waitForKey(const QString &message)
{
    if (!suspended_ || !ttyIn_ || !ttyOut_) {
        return;
    }

    std::fputs(message.toUtf8().constData(), ttyOut_);
    std::fflush(ttyOut_);

    // endwin() restored the shell's line mode, so this reads a whole line.
    int c;
    do {
        c = std::fgetc(ttyIn_);
    } while (c != '\n' && c != EOF);
}

std::optional<int> SectionMenu::prompt(const QString &title,
                                       const QStringList &entries,
                                       const QString &help)
{
    if (!screen_ || entries.isEmpty()) {
        return std::nullopt;
    }

    if (suspended_) {
        reset_prog_mode();
        suspended_ = false;
    }

    const int count = static_cast<int>(entries.size());
    int selected = 0;

    while (true) {
        draw(title, entries, help, selected);

        const int ch = getch();
        switch (ch) {
        case KEY_UP:
        case 'k':
            selected = (selected + count - 1) % count;
            break;
        case KEY_DOWN:
        case 'j':
            selected = (selected + 1) % count;
            break;
        case KEY_HOME:
            selected = 0;
            break;
        case KEY_END:
            selected = count - 1;
            break;
        case '\n':
        case '\r':
        case KEY_ENTER:
            return selected;
        case kKeyEscape:
        case 'q':
        case 'Q':
        case ERR:
        case 4: // Ctrl-D
            return std::nullopt;
        case KEY_RESIZE:
            break;
        default:
            if (ch >= '1' && ch < '1' + count) {
                return ch - '1';
            }
            break;
        }
    }
}

void SectionMenu::draw(const QString &title,
                       const QStringList &entries,
                       const QString &help,
                       int selected) const
{
    erase();

    if (hasColors_) attron(COLOR_PAIR(CP_TITLE) | A_BOLD);
    mvaddstr(1, 1, title.toUtf8().constData());
    if (hasColors_) attroff(COLOR_PAIR(CP_TITLE) | A_BOLD);

    for (int i = 0; i < entries.size(); ++i) {
        const bool isSelected = (i == selected);
        const QString line = (isSelected ? QStringLiteral("> ") : QStringLiteral("  "))
                           + entries.at(i);

        if (isSelected) {
            attron(A_BOLD | (hasColors_ ? COLOR_PAIR(CP_SELECTED) : A_REVERSE));
        }
        mvaddstr(kFirstRow + i, 1, line.toUtf8().constData());
        if (isSelected) {
            attroff(A_BOLD | (hasColors_ ? COLOR_PAIR(CP_SELECTED) : A_REVERSE));
        }
    }

    if (!help.isEmpty()) {
        if (hasColors_) attron(COLOR_PAIR(CP_HELP) | A_DIM);
        mvaddstr(kFirstRow + static_cast<int>(entries.size()) + 1, 1,
                 help.toUtf8().constData());
        if (hasColors_) attroff(COLOR_PAIR(CP_HELP) | A_DIM);
    }

    refresh();
}

} // namespace dmesg
