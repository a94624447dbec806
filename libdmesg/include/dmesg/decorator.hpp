#pragma once

#include <QString>

#include <optional>

namespace dmesg {

// SGR parameter for a color name such as "red" or "bold red", or
// std::nullopt if the name is not one we know.
std::optional<QString> ansiCodeForColor(const QString &color);

// Returns "<icon> <line>" with the line wrapped in ANSI color codes.
// Unknown color names leave the line unstyled.
QString decorateLine(const QString &line, const QString &color, const QString &icon);

} // namespace dmesg
