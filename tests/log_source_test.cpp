#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "log_source.hpp"

#include <cstdio>

#include <fcntl.h>
#include <unistd.h>

#include "test_support.hpp"

using dmesg::LogSource;

TEST(LogSourceSplitLines, DropsOnlyTheTrailingNewline)
{
    EXPECT_EQ(LogSource::splitLines("a\nb\n"),
              (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
    EXPECT_EQ(LogSource::splitLines("a\n\nb"),
              (QStringList{QStringLiteral("a"), QString(), QStringLiteral("b")}));
    EXPECT_EQ(LogSource::splitLines("a\r\nb\r\n"),
              (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
    EXPECT_TRUE(LogSource::splitLines("").isEmpty());
    EXPECT_EQ(LogSource::splitLines("\n"), QStringList{QString()});
}

TEST(LogSourceSplitLines, DecodesUtf8)
{
    EXPECT_EQ(LogSource::splitLines("temp 45\xc2\xb0" "C\n"),
              QStringList{QStringLiteral("temp 45°C")});
}

TEST(LogSource, ReadsFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString path = dir.filePath(QStringLiteral("dmesg.log"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("[    0.000000] Linux version 6.1\n[    1.234567] usb 1-1: new device\n");
    file.close();

    LogSource source = LogSource::fromFile(path);
    QStringList lines;
    ASSERT_TRUE(source.readLines(lines)) << source.lastError().toStdString();
    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines.at(1), QStringLiteral("[    1.234567] usb 1-1: new device"));
    EXPECT_TRUE(source.lastError().isEmpty());
}

TEST(LogSource, MissingFileFails)
{
    QTemporaryDir dir;
    LogSource source = LogSource::fromFile(dir.filePath(QStringLiteral("nope.log")));

    QStringList lines;
    EXPECT_FALSE(source.readLines(lines));
    EXPECT_TRUE(source.lastError().contains(QStringLiteral("does not exist")));
}

TEST(LogSource, CapturesCommandOutput)
{
    LogSource source = LogSource::fromCommand(QStringLiteral("sh"),
                                              {QStringLiteral("-c"),
                                               QStringLiteral("printf 'one\\ntwo\\n'")});
    QStringList lines;
    ASSERT_TRUE(source.readLines(lines)) << source.lastError().toStdString();
    EXPECT_EQ(lines, (QStringList{QStringLiteral("one"), QStringLiteral("two")}));
}

TEST(LogSource, NonZeroExitIsAFailure)
{
    LogSource source = LogSource::fromCommand(QStringLiteral("sh"),
                                              {QStringLiteral("-c"),
                                               QStringLiteral("echo denied >&2; exit 3")});
    QStringList lines;
    EXPECT_FALSE(source.readLines(lines));
    EXPECT_TRUE(source.lastError().contains(QStringLiteral("status 3")));
    EXPECT_TRUE(source.lastError().contains(QStringLiteral("denied")));
}

TEST(LogSource, UnknownCommandIsAFailure)
{
    LogSource source = LogSource::fromCommand(QStringLiteral("/nonexistent/dmesg-analyzer-test"));
    QStringList lines;
    EXPECT_FALSE(source.readLines(lines));
    EXPECT_FALSE(source.lastError().isEmpty());
}

TEST(LogSource, UnreadableStdinIsAFailure)
{
    // Standard input pointing at a directory: open works, every read fails.
    const int dirFd = ::open("/", O_RDONLY | O_DIRECTORY);
    ASSERT_GE(dirFd, 0);
    const int savedStdin = ::dup(STDIN_FILENO);
    ASSERT_GE(savedStdin, 0);
    ASSERT_GE(::dup2(dirFd, STDIN_FILENO), 0);
    ::close(dirFd);

    LogSource source = LogSource::fromStdin();
    QStringList lines;
    const bool ok = source.readLines(lines);
    const QString error = source.lastError();

    ::dup2(savedStdin, STDIN_FILENO);
    ::close(savedStdin);
    std::clearerr(stdin);

    EXPECT_FALSE(ok);
    EXPECT_TRUE(lines.isEmpty());
    EXPECT_TRUE(error.contains(QStringLiteral("standard input"))) << error.toStdString();
}

TEST(LogSource, DescribesItself)
{
    EXPECT_EQ(LogSource::fromFile(QStringLiteral("/var/log/dmesg")).description(),
              QStringLiteral("/var/log/dmesg"));
    EXPECT_EQ(LogSource::fromStdin().description(), QStringLiteral("<stdin>"));
    EXPECT_EQ(LogSource::fromCommand(QStringLiteral("dmesg"), {QStringLiteral("-T")}).description(),
              QStringLiteral("dmesg -T"));
}
