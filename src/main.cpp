#include <QApplication>
#include <QDir>
#include <QFileInfo>

#include <memory>

#include "sscope/main_window.hpp"
#include "sscope/telemetry.hpp"
#include "sscope/tool_config.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("SplunkScope");
    app.setOrganizationName("SplunkScope");

    sscope::ToolConfig config = sscope::ToolConfig::defaults();
    const QString configPath = QDir(QDir::currentPath()).filePath("splunkscope.json");
    if (QFileInfo::exists(configPath)) {
        const QJsonObject status = sscope::ToolConfig::loadFromFile(configPath, &config);
        if (!status.value("success").toBool(false)) {
            sscope::Telemetry::instance().recordEvent("config_rejected", status);
        }
    }
    if (!config.logFile().isEmpty()) {
        sscope::Telemetry::instance().setLogFile(QDir(QDir::currentPath()).filePath(config.logFile()));
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, []() {
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        sscope::Telemetry::instance().exportToFile(path);
    });

    sscope::MainWindow window(std::make_shared<const sscope::ToolConfig>(config));
    window.show();

    return QApplication::exec();
}
