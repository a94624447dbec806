#include "dmesg/decorator.hpp"

#include <QRegularExpression>

namespace dmesg {

namespace {

constexpr const char *kEscape = "\x1b[";
constexpr const char *kReset  = "\x1b[0m";

QString normalizeColorName(const QString &color)
{
    // "Bold-Red", "bold_red" and " bold  red " all mean the same thing.
    static const QRegularExpression separators(QStringLiteral("[\\s_-]+"));
    QString name = color.trimmed().toLower();
    name.replace(separators, QStringLiteral(" "));
    return name;
}

} // namespace

std::optional<QString> ansiCodeForColor(const QString &color)
{
    const QString name = normalizeColorName(color);

    if (name == QLatin1String("red"))
        return QStringLiteral("31");
    if (name == QLatin1String("bold red"))
        return QStringLiteral("1;31");
    if (name == QLatin1String("green"))
        return QStringLiteral("32");
    if (name == QLatin1String("yellow"))
        return QStringLiteral("33");
    if (name == QLatin1String("blue"))
        return QStringLiteral("34");
    if (name == QLatin1String("magenta"))
        return QStringLiteral("35");
    if (name == QLatin1String("cyan"))
        return QStringLiteral("36");
    if (name == QLatin1String("white"))
        return QStringLiteral("37");
    if (name == QLatin1String("black"))
        return QStringLiteral("30");

    return std::nullopt;
}

QString decorateLine(const QString &line, const QString &color, const QString &icon)
{
    const std::optional<QString> code = ansiCodeForColor(color);
    if (!code) {
        return icon + QLatin1Char(' ') + line;
    }

    return icon + QLatin1Char(' ')
         + QLatin1String(kEscape) + *code + QLatin1Char('m')
         + line
         + QLatin1String(kReset);
}

} // namespace dmesg
