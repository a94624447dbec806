#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QTextStream>

#include <csignal>
#include <cstdio>
#include <optional>
#include <utility>

#include "dmesg/bucketing.hpp"
#include "dmesg/config_resolver.hpp"

#include "log_source.hpp"
#include "viewer.hpp"

namespace {

constexpr int kExitLogSourceFailure = 1;
constexpr int kExitBrokenDefaults   = 2;

dmesg::LogSource makeLogSource(const QCommandLineParser &parser,
                               const QCommandLineOption &fileOption)
{
    if (!parser.isSet(fileOption)) {
        return dmesg::LogSource::fromCommand(QStringLiteral("dmesg"));
    }

    const QString path = parser.value(fileOption);
    if (path == QLatin1String("-")) {
        return dmesg::LogSource::fromStdin();
    }
    return dmesg::LogSource::fromFile(path);
}

} // namespace

int main(int argc, char *argv[])
{
    // A pager that quits early must not take us down with it.
    std::signal(SIGPIPE, SIG_IGN);

    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("dmesg-analyzer"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    qSetMessagePattern(QStringLiteral("dmesg-analyzer: %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Highlight and summarize dmesg logs with colors and rules, interactively."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption fileOption(
        {QStringLiteral("f"), QStringLiteral("file")},
        QStringLiteral("Read the kernel log from <path> (\"-\" for stdin) instead of running dmesg."),
        QStringLiteral("path"));
    const QCommandLineOption rulesOption(
        {QStringLiteral("r"), QStringLiteral("rules")},
        QStringLiteral("Rule file to use before the user and system defaults."),
        QStringLiteral("path"));
    const QCommandLineOption dumpRulesOption(
        QStringLiteral("dump-rules"),
        QStringLiteral("Print the active rule set as JSON and exit."));

    parser.addOption(fileOption);
    parser.addOption(rulesOption);
    parser.addOption(dumpRulesOption);
    parser.process(app);

    std::optional<QString> explicitRules;
    if (parser.isSet(rulesOption)) {
        explicitRules = parser.value(rulesOption);
    }

    const std::optional<dmesg::ResolvedRules> resolved =
        dmesg::resolveRules(explicitRules, dmesg::embeddedDefaultRules());
    if (!resolved) {
        qCritical() << "No usable rule set; the built-in defaults are broken";
        return kExitBrokenDefaults;
    }

    qInfo().noquote() << "Using rules from:" << resolved->source;

    if (parser.isSet(dumpRulesOption)) {
        QTextStream out(stdout);
        out << QJsonDocument(dmesg::ruleSetToJson(resolved->rules)).toJson(QJsonDocument::Indented);
        return 0;
    }

    dmesg::LogSource source = makeLogSource(parser, fileOption);

    QStringList lines;
    if (!source.readLines(lines)) {
        qCritical().noquote() << "Failed to read kernel log from"
                              << source.description() << "-" << source.lastError();
        return kExitLogSourceFailure;
    }

    dmesg::Buckets buckets = dmesg::bucketLines(lines, resolved->rules);

    qInfo().noquote() << QStringLiteral("Classified %1 lines: %2 critical, %3 error, %4 warning, %5 info")
                             .arg(buckets.totalLines())
                             .arg(buckets.critical.size())
                             .arg(buckets.error.size())
                             .arg(buckets.warning.size())
                             .arg(buckets.info.size());

    dmesg::Viewer viewer(std::move(buckets));
    return viewer.run();
}
