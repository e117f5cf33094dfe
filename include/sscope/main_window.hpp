#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QLabel>
#include <QLineEdit>
#include <QMainWindow>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QString>
#include <QTableWidget>
#include <QTabWidget>
#include <QThread>
#include <QTreeWidget>

#include <memory>

#include "sscope/discovery_worker.hpp"
#include "sscope/tool_config.hpp"

namespace sscope {

class MainWindow final : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(std::shared_ptr<const ToolConfig> config);
    ~MainWindow() override;

signals:
    void discoveryRequested(const QString& seedPath);
    void actionRequested(const QString& action, const QJsonObject& payload);

private:
    void setupUi();
    void setupWorker();
    void setupConnections();

    void startDiscovery();
    void cancelDiscovery();
    void setRunning(bool running);

    void onInstanceCompleted(const QJsonObject& progress);
    void onDiscoveryFinished(const QJsonObject& summary);
    void onActionFinished(const QJsonObject& result);

    void clearResults();
    void appendInstanceRow(const QJsonObject& report, const QString& layerLabel = {});
    void appendPlaceholderRow(const QJsonObject& placeholder, const QString& layerLabel);
    void appendHealthRows(const QJsonObject& report);
    void renderResult(const QJsonObject& result, const QJsonObject& topology);
    void renderTopology(const QJsonObject& topology);

    void requestExport(const QString& action, const QString& format, const QString& filter);
    void appendLog(const QString& line);
    void showMessage(const QString& message, bool error = false) const;

    std::shared_ptr<const ToolConfig> config_;
    QThread* workerThread_ = nullptr;
    DiscoveryWorker* worker_ = nullptr;
    bool running_ = false;

    QWidget* central_ = nullptr;
    QLineEdit* seedPathInput_ = nullptr;
    QPushButton* browseButton_ = nullptr;
    QPushButton* startButton_ = nullptr;
    QPushButton* cancelButton_ = nullptr;
    QPushButton* exportButton_ = nullptr;
    QPushButton* loadConfigButton_ = nullptr;
    QPushButton* telemetryExportButton_ = nullptr;
    QProgressBar* progressBar_ = nullptr;
    QLabel* summaryLabel_ = nullptr;
    QLabel* configLabel_ = nullptr;
    QTabWidget* tabs_ = nullptr;

    QTableWidget* instanceTable_ = nullptr;
    QTableWidget* healthTable_ = nullptr;
    QTreeWidget* topologyTree_ = nullptr;
    QTableWidget* edgeTable_ = nullptr;
    QPlainTextEdit* activityLog_ = nullptr;
};

}  // namespace sscope
