#include "log_source.hpp"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QProcess>

#include <cstdio>

namespace dmesg {

namespace {

constexpr int kStartTimeoutMs  = 3000;
constexpr int kFinishTimeoutMs = 30000;

} // namespace

LogSource::LogSource(Kind kind, QString target, QStringList arguments)
    : kind_(kind)
    , target_(std::move(target))
    , arguments_(std::move(arguments))
{
}

LogSource LogSource::fromFile(const QString &path)
{
    return LogSource(Kind::File, path);
}

LogSource LogSource::fromStdin()
{
    return LogSource(Kind::Stdin, QStringLiteral("-"));
}

LogSource LogSource::fromCommand(const QString &program, const QStringList &arguments)
{
    return LogSource(Kind::Command, program, arguments);
}

QString LogSource::description() const
{
    switch (kind_) {
    case Kind::File:
        return target_;
    case Kind::Stdin:
        return QStringLiteral("<stdin>");
    case Kind::Command:
        return (QStringList{target_} + arguments_).join(QLatin1Char(' '));
    }
    return target_;
}

bool LogSource::readLines(QStringList &outLines)
{
    QByteArray data;
    bool ok = false;

    switch (kind_) {
    case Kind::File:
        ok = readFile(data);
        break;
    case Kind::Stdin:
        ok = readStdin(data);
        break;
    case Kind::Command:
        ok = runCommand(data);
        break;
    }

    if (!ok) {
        qWarning().noquote() << "LogSource:" << lastError_;
        return false;
    }

    outLines = splitLines(data);
    lastError_.clear();
    return true;
}

QStringList LogSource::splitLines(const QByteArray &data)
{
    QString text = QString::fromUtf8(data);
    text.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));

    if (text.isEmpty()) {
        return {};
    }

    QStringList lines = text.split(QLatin1Char('\n'));

    // A terminating newline ends the last line, it does not start a new one.
    if (text.endsWith(QLatin1Char('\n'))) {
        lines.removeLast();
    }

    return lines;
}

bool LogSource::readFile(QByteArray &outData)
{
    if (!QFileInfo::exists(target_)) {
        lastError_ = QStringLiteral("log file %1 does not exist").arg(target_);
        return false;
    }

    QFile file(target_);
    if (!file.open(QIODevice::ReadOnly)) {
        lastError_ = QStringLiteral("cannot open log file %1: %2")
                         .arg(target_, file.errorString());
        return false;
    }

    outData = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        lastError_ = QStringLiteral("cannot read log file %1: %2")
                         .arg(target_, file.errorString());
        return false;
    }

    return true;
}

bool LogSource::readStdin(QByteArray &outData)
{
    QFile in;
    if (!in.open(stdin, QIODevice::ReadOnly)) {
        lastError_ = QStringLiteral("cannot open standard input: %1").arg(in.errorString());
        return false;
    }

    outData = in.readAll();
    if (in.error() != QFileDevice::NoError) {
        lastError_ = QStringLiteral("cannot read standard input: %1").arg(in.errorString());
        return false;
    }
    return true;
}

bool LogSource::runCommand(QByteArray &outData)
{
    QProcess process;
    process.setProgram(target_);
    process.setArguments(arguments_);
    process.setProcessChannelMode(QProcess::SeparateChannels);

    process.start();
    if (!process.waitForStarted(kStartTimeoutMs)) {
        lastError_ = QStringLiteral("failed to start %1: %2")
                         .arg(description(), process.errorString());
        return false;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(kFinishTimeoutMs)) {
        lastError_ = QStringLiteral("%1 did not finish within %2 s")
                         .arg(description())
                         .arg(kFinishTimeoutMs / 1000);
        process.kill();
        process.waitForFinished(1000);
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        lastError_ = QStringLiteral("%1 crashed").arg(description());
        return false;
    }

    if (process.exitCode() != 0) {
        const QString stderrText =
            QString::fromLocal8Bit(process.readAllStandardError()).trimmed();
        lastError_ = QStringLiteral("%1 exited with status %2")
                         .arg(description())
                         .arg(process.exitCode());
        if (!stderrText.isEmpty()) {
            lastError_ += QStringLiteral(": ") + stderrText;
        }
        return false;
    }

    outData = process.readAllStandardOutput();
    return true;
}

} // namespace dmesg
