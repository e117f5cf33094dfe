#include "sscope/command_runner.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QProcessEnvironment>

#include "sscope/telemetry.hpp"

namespace sscope {

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs,
    const QByteArray& stdinData,
    const QMap<QString, QString>& extraEnv) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();
    if (!extraEnv.isEmpty()) {
        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        for (auto it = extraEnv.constBegin(); it != extraEnv.constEnd(); ++it) {
            env.insert(it.key(), it.value());
        }
        process.setProcessEnvironment(env);
    }

    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(timeoutMs)) {
        result.failedToStart = true;
        result.stderrText = QString("Failed to start %1: %2").arg(program, process.errorString());
        Telemetry::instance().incrementCounter("commands.start_failures");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    if (!stdinData.isEmpty()) {
        process.write(stdinData);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.timedOut = true;
        result.stderrText = "Command timed out.";
        Telemetry::instance().incrementCounter("commands.timeouts");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdoutData = process.readAllStandardOutput();
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    Telemetry::instance().incrementCounter("commands.count");
    if (result.exitCode != 0) {
        Telemetry::instance().incrementCounter("commands.non_zero_exit");
    }
    Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
    return result;
}

}  // namespace sscope
