#include "pager.hpp"

#include <QDebug>
#include <QProcess>
#include <QTextStream>

#include <cstdio>

namespace dmesg {

namespace {

constexpr int kStartTimeoutMs = 3000;

} // namespace

Pager::Pager(QString program, QStringList arguments)
    : program_(std::move(program))
    , arguments_(std::move(arguments))
{
}

bool Pager::show(const QString &content)
{
    QProcess pager;
    pager.setProgram(program_);
    pager.setArguments(arguments_);
    // The pager draws on our terminal; only its stdin is ours to feed.
    pager.setProcessChannelMode(QProcess::ForwardedChannels);

    pager.start();
    if (!pager.waitForStarted(kStartTimeoutMs)) {
        qWarning().noquote() << "Pager: failed to launch" << program_
                             << "-" << pager.errorString() << "; printing directly";
        printDirect(content);
        return false;
    }

    QByteArray data = content.toUtf8();
    if (!data.endsWith('\n')) {
        data.append('\n');
    }

    pager.write(data);
    pager.closeWriteChannel();

    // The user decides when the pager ends.
    pager.waitForFinished(-1);

    if (pager.exitStatus() != QProcess::NormalExit) {
        qWarning().noquote() << "Pager:" << program_ << "terminated abnormally";
    }

    return true;
}

void Pager::printDirect(const QString &content)
{
    QTextStream out(stdout);
    out << content;
    if (!content.endsWith(QLatin1Char('\n'))) {
        out << '\n';
    }
    out.flush();
}

} // namespace dmesg
