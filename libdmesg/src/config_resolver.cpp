#include "dmesg/config_resolver.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QtGlobal>

#ifndef DMESG_SYSTEM_RULES_PATH
#define DMESG_SYSTEM_RULES_PATH "/usr/share/dmesg-analyzer/default_rules.json"
#endif

namespace dmesg {

namespace {

constexpr const char *kAppDirName       = "dmesg-analyzer";
constexpr const char *kUserRulesFile    = "rules.json";
constexpr const char *kEmbeddedResource = ":/dmesg/default_rules.json";

void fail(ConfigError error, const QString &message,
          ConfigError *outError, QString *outMessage)
{
    if (outError) {
        *outError = error;
    }
    if (outMessage) {
        *outMessage = message;
    }
}

const char *errorName(ConfigError error)
{
    switch (error) {
    case ConfigError::SourceUnavailable:
        return "source unavailable";
    case ConfigError::MalformedConfig:
        return "malformed config";
    }
    return "unknown error";
}

} // namespace

QString embeddedSourceName()
{
    return QStringLiteral("embedded");
}

QByteArray embeddedDefaultRules()
{
    QFile file(QString::fromUtf8(kEmbeddedResource));
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "ConfigResolver: embedded rules resource missing:" << kEmbeddedResource;
        return {};
    }
    return file.readAll();
}

QString userRulesPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        if (home.isEmpty()) {
            return {};
        }
        base = QDir(home).filePath(QStringLiteral(".config"));
    }

    return QDir(base).filePath(QString::fromUtf8(kAppDirName)
                               + QLatin1Char('/')
                               + QString::fromUtf8(kUserRulesFile));
}

QString systemRulesPath()
{
    return QStringLiteral(DMESG_SYSTEM_RULES_PATH);
}

std::optional<RuleSet> loadRuleFile(const QString &path,
                                    ConfigError *outError,
                                    QString *outMessage)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        fail(ConfigError::SourceUnavailable, QStringLiteral("file does not exist"),
             outError, outMessage);
        return std::nullopt;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        fail(ConfigError::SourceUnavailable, file.errorString(), outError, outMessage);
        return std::nullopt;
    }

    const QByteArray text = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        fail(ConfigError::SourceUnavailable, file.errorString(), outError, outMessage);
        return std::nullopt;
    }

    QString parseError;
    std::optional<RuleSet> rules = ruleSetFromJson(text, &parseError);
    if (!rules) {
        fail(ConfigError::MalformedConfig, parseError, outError, outMessage);
        return std::nullopt;
    }

    return rules;
}

QStringList defaultCandidates(const std::optional<QString> &explicitPath)
{
    QStringList candidates;

    if (explicitPath.has_value()) {
        candidates << *explicitPath;
    }

    const QString userPath = userRulesPath();
    if (!userPath.isEmpty()) {
        candidates << userPath;
    }

    candidates << systemRulesPath();
    return candidates;
}

std::optional<ResolvedRules> resolveFromCandidates(const QStringList &candidates,
                                                   const QByteArray &embeddedDefault)
{
    for (const QString &path : candidates) {
        ConfigError error = ConfigError::SourceUnavailable;
        QString message;

        std::optional<RuleSet> rules = loadRuleFile(path, &error, &message);
        if (rules) {
            return ResolvedRules{std::move(*rules), path};
        }

        qWarning().noquote() << "ConfigResolver: skipping" << path
                             << "-" << errorName(error) << ":" << message;
    }

    QString message;
    std::optional<RuleSet> rules = ruleSetFromJson(embeddedDefault, &message);
    if (!rules) {
        qCritical().noquote() << "ConfigResolver: embedded default rules are invalid:" << message;
        return std::nullopt;
    }

    return ResolvedRules{std::move(*rules), embeddedSourceName()};
}

std::optional<ResolvedRules> resolveRules(const std::optional<QString> &explicitPath,
                                          const QByteArray &embeddedDefault)
{
    return resolveFromCandidates(defaultCandidates(explicitPath), embeddedDefault);
}

} // namespace dmesg
