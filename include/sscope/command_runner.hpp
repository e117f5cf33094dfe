#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>

namespace sscope {

struct CommandResult {
    int exitCode = -1;
    QByteArray stdoutData;
    QString stderrText;
    bool timedOut = false;
    bool failedToStart = false;

    [[nodiscard]] bool success() const { return !timedOut && !failedToStart && exitCode == 0; }
    [[nodiscard]] QString stdoutText() const { return QString::fromUtf8(stdoutData); }
};

class CommandRunner {
public:
    // stdinData is written to the child and the write channel closed before waiting.
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 3000,
        const QByteArray& stdinData = {},
        const QMap<QString, QString>& extraEnv = {});
};

}  // namespace sscope
