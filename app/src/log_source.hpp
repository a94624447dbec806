#pragma once

#include <QString>
#include <QStringList>

namespace dmesg {

// Where raw kernel log lines come from: a file, stdin, or the output of
// a command such as `dmesg`.
class LogSource
{
public:
    static LogSource fromFile(const QString &path);
    static LogSource fromStdin();
    static LogSource fromCommand(const QString &program,
                                 const QStringList &arguments = {});

    // Reads every line. Returns false on failure; lastError() says why.
    bool readLines(QStringList &outLines);

    QString description() const;
    QString lastError() const { return lastError_; }

    static QStringList splitLines(const QByteArray &data);

private:
    enum class Kind {
        File,
        Stdin,
        Command
    };

    LogSource(Kind kind, QString target, QStringList arguments = {});

    bool readFile(QByteArray &outData);
    bool readStdin(QByteArray &outData);
    bool runCommand(QByteArray &outData);

    Kind kind_;
    QString target_;
    QStringList arguments_;
    QString lastError_;
};

} // namespace dmesg
