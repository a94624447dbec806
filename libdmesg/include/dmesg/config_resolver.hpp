#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

#include "dmesg/rules.hpp"

namespace dmesg {

enum class ConfigError {
    SourceUnavailable, // missing or unreadable file
    MalformedConfig    // not JSON, or required fields missing / mistyped
};

struct ResolvedRules
{
    RuleSet rules;
    // Path of the file the rules came from, or "embedded".
    QString source;
};

// Descriptor reported when the built-in rules are used.
QString embeddedSourceName();

// Rule document compiled into the library.
QByteArray embeddedDefaultRules();

// $XDG_CONFIG_HOME/dmesg-analyzer/rules.json, falling back to
// $HOME/.config. Empty if neither variable is set.
QString userRulesPath();

// System-wide rules installed alongside the package.
QString systemRulesPath();

// Loads and parses one rule file. On failure returns std::nullopt and
// fills whichever of outError/outMessage are given.
std::optional<RuleSet> loadRuleFile(const QString &path,
                                    ConfigError *outError = nullptr,
                                    QString *outMessage = nullptr);

// Candidate files in priority order: the explicit path (if any), the
// per-user file, then the system-wide file.
QStringList defaultCandidates(const std::optional<QString> &explicitPath);

// Tries each candidate in turn, logging every failure, then falls back to
// embeddedDefault. Returns std::nullopt only if embeddedDefault itself is
// broken, which is a packaging defect the caller must treat as fatal.
std::optional<ResolvedRules> resolveFromCandidates(const QStringList &candidates,
                                                   const QByteArray &embeddedDefault);

std::optional<ResolvedRules> resolveRules(const std::optional<QString> &explicitPath,
                                          const QByteArray &embeddedDefault);

} // namespace dmesg
