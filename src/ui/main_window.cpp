#include "sscope/main_window.hpp"

#include <QBrush>
#include <QColor>
#include <QDateTime>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QIcon>
#include <QJsonValue>
#include <QMap>
#include <QMenu>
#include <QMessageBox>
#include <QSplitter>
#include <QStatusBar>
#include <QStyle>
#include <QTableWidgetItem>
#include <QVBoxLayout>

#include <utility>

#include "sscope/telemetry.hpp"

namespace sscope {

namespace {

struct CellColors {
    QColor background;
    QColor foreground;
};

bool colorsForOutcome(const QString& outcome, CellColors* out) {
    if (outcome == "failed") {
        *out = {QColor("#432125"), QColor("#ffd6da")};
        return true;
    }
    if (outcome == "partial") {
        *out = {QColor("#3f3823"), QColor("#ffefc7")};
        return true;
    }
    if (outcome == "unvisited") {
        *out = {QColor("#262b31"), QColor("#9aa5b1")};
        return true;
    }
    return false;
}

bool colorsForHealth(const QString& status, CellColors* out) {
    if (status == "Warning") {
        *out = {QColor("#432125"), QColor("#ffd6da")};
        return true;
    }
    if (status == "Caution") {
        *out = {QColor("#3f3823"), QColor("#ffefc7")};
        return true;
    }
    if (status == "Unknown") {
        *out = {QColor("#262b31"), QColor("#9aa5b1")};
        return true;
    }
    return false;
}

void appendRow(QTableWidget* table, const QStringList& cells, const CellColors* colors, const QString& tooltip = {}) {
    const int row = table->rowCount();
    table->insertRow(row);
    for (int column = 0; column < cells.size(); ++column) {
        auto* item = new QTableWidgetItem(cells.at(column));
        if (colors != nullptr) {
            item->setBackground(QBrush(colors->background));
            item->setForeground(QBrush(colors->foreground));
        }
        if (!tooltip.isEmpty()) {
            item->setToolTip(tooltip);
        }
        table->setItem(row, column, item);
    }
}

QStringList stringList(const QJsonArray& array) {
    QStringList out;
    for (const QJsonValue& value : array) {
        out.append(value.toString());
    }
    return out;
}

QString instanceId(const QJsonObject& object) {
    const QString address = object.value("address").toString();
    const int port = object.value("port").toInt();
    return address.contains(':') ? QString("[%1]:%2").arg(address).arg(port) : QString("%1:%2").arg(address).arg(port);
}

QIcon themedIcon(const QWidget* widget, const QString& themeName, QStyle::StandardPixmap fallback) {
    const QIcon icon = QIcon::fromTheme(themeName);
    if (!icon.isNull()) {
        return icon;
    }
    if (widget != nullptr) {
        return widget->style()->standardIcon(fallback);
    }
    return {};
}

QTableWidget* makeTable(const QStringList& headers, QWidget* parent) {
    auto* table = new QTableWidget(0, headers.size(), parent);
    table->setHorizontalHeaderLabels(headers);
    table->setAlternatingRowColors(true);
    table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    table->setSelectionBehavior(QAbstractItemView::SelectRows);
    table->verticalHeader()->setVisible(false);
    table->horizontalHeader()->setStretchLastSection(true);
    table->horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    return table;
}

}  // namespace

MainWindow::MainWindow(std::shared_ptr<const ToolConfig> config)
    : config_(std::move(config)) {
    setupUi();
    setupWorker();
    setupConnections();
    setRunning(false);
}

MainWindow::~MainWindow() {
    if (worker_ != nullptr) {
        worker_->requestCancel();
    }
    if (workerThread_ != nullptr) {
        workerThread_->quit();
        workerThread_->wait();
    }
}

void MainWindow::setupUi() {
    setWindowTitle("SplunkScope");
    resize(1440, 900);
    setMinimumSize(1000, 640);

    central_ = new QWidget(this);
    setCentralWidget(central_);
    setStyleSheet(
        "QWidget { background:#171b20; color:#e3e7ec; font-size:13px; }"
        "QLabel { color:#e3e7ec; }"
        "QPushButton { background:#2a3138; color:#f0f3f6; border:1px solid #3a444f; border-radius:8px; padding:6px 10px; }"
        "QPushButton:hover { background:#333c45; }"
        "QPushButton:pressed { background:#242b32; }"
        "QPushButton:disabled { background:#21272d; color:#8f9ba7; border-color:#313941; }"
        "QLineEdit, QPlainTextEdit, QTreeWidget, QTableWidget {"
        "  background:#1f252c; color:#e3e7ec; border:1px solid #3a444f; border-radius:8px; selection-background-color:#4d6a55; }"
        "QTableWidget {"
        "  background:#1f252c; alternate-background-color:#26303a; color:#e6edf5; gridline-color:#34414d; }"
        "QTableWidget::item { padding:4px; }"
        "QTableWidget::item:selected { background:#3d5c4c; color:#f4f9ff; }"
        "QTreeWidget { background:#1f252c; alternate-background-color:#26303a; color:#e6edf5; }"
        "QTreeWidget::item:selected { background:#3d5c4c; color:#f4f9ff; }"
        "QProgressBar { background:#1f252c; border:1px solid #3a444f; border-radius:8px; text-align:center; }"
        "QProgressBar::chunk { background:#4d6a55; border-radius:7px; }"
        "QTabWidget::pane { border:1px solid #3a444f; border-radius:10px; background:#1b2127; }"
        "QTabBar::tab { background:#272f37; color:#c7d0d9; border:1px solid #3a444f; border-bottom:none; padding:8px 12px; margin-right:2px; border-top-left-radius:8px; border-top-right-radius:8px; }"
        "QTabBar::tab:selected { background:#34404a; color:#f4f7fa; }"
        "QHeaderView::section { background:#2a3138; color:#d3dce5; border:1px solid #3a444f; padding:6px; }"
        "QStatusBar { background:#1d232a; color:#9faebb; border-top:1px solid #3a444f; }");

    auto* root = new QVBoxLayout(central_);
    root->setContentsMargins(10, 10, 10, 10);
    root->setSpacing(8);

    auto* header = new QHBoxLayout();
    auto* title = new QLabel("SplunkScope");
    title->setStyleSheet("font-size: 20px; font-weight: 700;");
    configLabel_ = new QLabel();
    configLabel_->setStyleSheet("color:#9faebb;");
    loadConfigButton_ = new QPushButton("Load Config");
    loadConfigButton_->setIcon(themedIcon(this, "document-open", QStyle::SP_DialogOpenButton));
    telemetryExportButton_ = new QPushButton("Export Telemetry");
    telemetryExportButton_->setIcon(themedIcon(this, "document-export", QStyle::SP_DialogSaveButton));
    auto* aboutButton = new QPushButton("About");
    aboutButton->setIcon(themedIcon(this, "help-about", QStyle::SP_MessageBoxInformation));
    header->addWidget(title);
    header->addSpacing(12);
    header->addWidget(configLabel_, 1);
    header->addWidget(loadConfigButton_);
    header->addWidget(telemetryExportButton_);
    header->addWidget(aboutButton);
    root->addLayout(header);

    auto* runRow = new QHBoxLayout();
    seedPathInput_ = new QLineEdit();
    seedPathInput_->setPlaceholderText("Seed list CSV (address,port,username,password)");
    browseButton_ = new QPushButton("Browse");
    browseButton_->setIcon(themedIcon(this, "folder-open", QStyle::SP_DialogOpenButton));
    startButton_ = new QPushButton("Start Discovery");
    startButton_->setIcon(themedIcon(this, "media-playback-start", QStyle::SP_MediaPlay));
    cancelButton_ = new QPushButton("Cancel");
    cancelButton_->setIcon(themedIcon(this, "process-stop", QStyle::SP_BrowserStop));
    exportButton_ = new QPushButton("Export");
    exportButton_->setIcon(themedIcon(this, "document-save", QStyle::SP_DialogSaveButton));

    auto* exportMenu = new QMenu(this);
    exportMenu->addAction(
        themedIcon(this, "x-office-spreadsheet", QStyle::SP_FileIcon),
        "Report (CSV)",
        [this]() { requestExport("export_csv", "csv", "CSV files (*.csv)"); });
    exportMenu->addAction(
        themedIcon(this, "text-x-generic", QStyle::SP_FileIcon),
        "Report (JSON)",
        [this]() { requestExport("export_json", "json", "JSON files (*.json)"); });
    exportMenu->addSeparator();
    exportMenu->addAction(
        themedIcon(this, "text-x-generic", QStyle::SP_FileIcon),
        "Topology (DOT)",
        [this]() { requestExport("export_topology", "dot", "Graphviz files (*.dot)"); });
    exportMenu->addAction(
        themedIcon(this, "image-x-generic", QStyle::SP_FileIcon),
        "Topology (PNG)",
        [this]() { requestExport("export_topology", "png", "PNG images (*.png)"); });
    exportMenu->addAction(
        themedIcon(this, "image-x-generic", QStyle::SP_FileIcon),
        "Topology (SVG)",
        [this]() { requestExport("export_topology", "svg", "SVG images (*.svg)"); });
    exportMenu->addAction(
        themedIcon(this, "application-pdf", QStyle::SP_FileIcon),
        "Topology (PDF)",
        [this]() { requestExport("export_topology", "pdf", "PDF documents (*.pdf)"); });
    exportButton_->setMenu(exportMenu);

    runRow->addWidget(seedPathInput_, 1);
    runRow->addWidget(browseButton_);
    runRow->addWidget(startButton_);
    runRow->addWidget(cancelButton_);
    runRow->addWidget(exportButton_);
    root->addLayout(runRow);

    auto* progressRow = new QHBoxLayout();
    progressBar_ = new QProgressBar();
    progressBar_->setRange(0, 1);
    progressBar_->setValue(0);
    progressBar_->setFormat("%v / %m instances");
    summaryLabel_ = new QLabel("No discovery run yet.");
    progressRow->addWidget(progressBar_, 1);
    progressRow->addWidget(summaryLabel_, 1);
    root->addLayout(progressRow);

    tabs_ = new QTabWidget();
    root->addWidget(tabs_, 1);

    instanceTable_ = makeTable(
        {"Instance", "Server Name", "Version", "Outcome", "Layer", "Roles", "Adjacencies", "Duration (ms)", "Error"},
        this);
    tabs_->addTab(instanceTable_, themedIcon(this, "network-server", QStyle::SP_ComputerIcon), "Instances");

    healthTable_ = makeTable({"Instance", "Metric", "Value", "Status"}, this);
    tabs_->addTab(healthTable_, themedIcon(this, "dialog-warning", QStyle::SP_MessageBoxWarning), "Health");

    auto* topologySplit = new QSplitter(Qt::Vertical);
    topologyTree_ = new QTreeWidget();
    topologyTree_->setHeaderLabels({"Layer / Instance", "State", "Roles"});
    topologyTree_->setAlternatingRowColors(true);
    edgeTable_ = makeTable({"From", "To", "Relation"}, this);
    topologySplit->addWidget(topologyTree_);
    topologySplit->addWidget(edgeTable_);
    topologySplit->setStretchFactor(0, 3);
    topologySplit->setStretchFactor(1, 2);
    tabs_->addTab(topologySplit, themedIcon(this, "network-workgroup", QStyle::SP_DirIcon), "Topology");

    activityLog_ = new QPlainTextEdit();
    activityLog_->setReadOnly(true);
    activityLog_->setStyleSheet("font-family:monospace;");
    activityLog_->setMaximumBlockCount(5000);
    tabs_->addTab(activityLog_, themedIcon(this, "text-x-generic", QStyle::SP_FileDialogDetailedView), "Activity Log");

    const QString source = config_->sourcePath();
    configLabel_->setText(source.isEmpty() ? "Configuration: built-in defaults" : QString("Configuration: %1").arg(source));
    statusBar()->showMessage("Ready");

    connect(aboutButton, &QPushButton::clicked, this, [this]() {
        QMessageBox::about(
            this,
            "About SplunkScope",
            "SplunkScope\n\n"
            "Polls Splunk Enterprise and Universal Forwarder instances over the "
            "management port, evaluates their health and lays out the deployment "
            "topology by role.");
    });
}

void MainWindow::setupWorker() {
    workerThread_ = new QThread(this);
    worker_ = new DiscoveryWorker(config_);
    worker_->moveToThread(workerThread_);
    connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);
    workerThread_->start();
}

void MainWindow::setupConnections() {
    connect(this, &MainWindow::discoveryRequested, worker_, &DiscoveryWorker::runDiscovery, Qt::QueuedConnection);
    connect(this, &MainWindow::actionRequested, worker_, &DiscoveryWorker::runAction, Qt::QueuedConnection);
    connect(worker_, &DiscoveryWorker::instanceCompleted, this, &MainWindow::onInstanceCompleted);
    connect(worker_, &DiscoveryWorker::discoveryFinished, this, &MainWindow::onDiscoveryFinished);
    connect(worker_, &DiscoveryWorker::actionFinished, this, &MainWindow::onActionFinished);

    connect(browseButton_, &QPushButton::clicked, this, [this]() {
        const QString path = QFileDialog::getOpenFileName(
            this,
            "Select seed list",
            QDir::currentPath(),
            "CSV files (*.csv);;All files (*)");
        if (!path.isEmpty()) {
            seedPathInput_->setText(path);
        }
    });
    connect(startButton_, &QPushButton::clicked, this, &MainWindow::startDiscovery);
    connect(seedPathInput_, &QLineEdit::returnPressed, this, &MainWindow::startDiscovery);
    connect(cancelButton_, &QPushButton::clicked, this, &MainWindow::cancelDiscovery);
    connect(loadConfigButton_, &QPushButton::clicked, this, [this]() {
        const QString path = QFileDialog::getOpenFileName(
            this,
            "Load configuration",
            QDir::currentPath(),
            "JSON files (*.json);;All files (*)");
        if (!path.isEmpty()) {
            emit actionRequested("load_config", {{"path", path}});
        }
    });
    connect(telemetryExportButton_, &QPushButton::clicked, this, [this]() {
        const QString path = QFileDialog::getSaveFileName(
            this,
            "Export telemetry",
            QDir(QDir::currentPath()).filePath("logs/telemetry.json"),
            "JSON files (*.json)");
        if (!path.isEmpty()) {
            emit actionRequested("export_telemetry", {{"path", path}});
        }
    });
}

void MainWindow::setRunning(bool running) {
    running_ = running;
    startButton_->setEnabled(!running);
    browseButton_->setEnabled(!running);
    seedPathInput_->setEnabled(!running);
    loadConfigButton_->setEnabled(!running);
    exportButton_->setEnabled(!running);
    cancelButton_->setEnabled(running);
}

void MainWindow::startDiscovery() {
    const QString seedPath = seedPathInput_->text().trimmed();
    if (seedPath.isEmpty()) {
        showMessage("Choose a seed list first.", true);
        return;
    }
    if (!QFileInfo::exists(seedPath)) {
        showMessage(QString("Seed list not found: %1").arg(seedPath), true);
        return;
    }
    clearResults();
    setRunning(true);
    progressBar_->setRange(0, 0);
    summaryLabel_->setText("Loading seed list...");
    appendLog(QString("Discovery started from %1").arg(seedPath));
    worker_->resetCancel();
    emit discoveryRequested(seedPath);
}

void MainWindow::cancelDiscovery() {
    if (!running_) {
        return;
    }
    worker_->requestCancel();
    cancelButton_->setEnabled(false);
    summaryLabel_->setText("Cancelling the current instance...");
    appendLog("Cancellation requested");
}

void MainWindow::clearResults() {
    instanceTable_->setRowCount(0);
    healthTable_->setRowCount(0);
    edgeTable_->setRowCount(0);
    topologyTree_->clear();
}

void MainWindow::onInstanceCompleted(const QJsonObject& progress) {
    const int total = progress.value("total").toInt();
    const int completed = progress.value("completed").toInt();
    progressBar_->setRange(0, qMax(1, total));
    progressBar_->setValue(completed);

    const QJsonObject report = progress.value("report").toObject();
    appendInstanceRow(report);
    appendHealthRows(report);
    summaryLabel_->setText(QString("Polled %1 of %2, %3 unvisited so far")
                               .arg(completed)
                               .arg(total)
                               .arg(progress.value("placeholders").toInt()));

    const QString outcome = report.value("outcome").toString();
    QString line = QString("%1 %2 in %3 ms")
                       .arg(instanceId(report), outcome)
                       .arg(static_cast<qint64>(report.value("duration_ms").toDouble()));
    if (outcome != "success") {
        line += QString(": %1").arg(report.value("error").toString());
    }
    appendLog(line);
}

void MainWindow::onDiscoveryFinished(const QJsonObject& summary) {
    setRunning(false);
    if (!summary.value("success").toBool(false)) {
        progressBar_->setRange(0, 1);
        progressBar_->setValue(0);
        const QString error = summary.value("error").toString();
        summaryLabel_->setText("Discovery did not start.");
        appendLog(QString("Seed list rejected:\n%1").arg(error));
        showMessage(error.section('\n', 0, 0), true);
        return;
    }

    const QJsonObject result = summary.value("result").toObject();
    const QJsonObject topology = summary.value("topology").toObject();
    renderResult(result, topology);
    renderTopology(topology);

    const int polled = summary.value("polled").toInt();
    progressBar_->setRange(0, qMax(1, polled));
    progressBar_->setValue(polled);
    const QString text =
        QString("%1 polled (%2 failed, %3 partial), %4 unvisited, %5 duplicate seed(s) skipped, %6 ms%7")
            .arg(polled)
            .arg(summary.value("failed").toInt())
            .arg(summary.value("partial").toInt())
            .arg(summary.value("placeholders").toInt())
            .arg(summary.value("skipped_duplicates").toInt())
            .arg(static_cast<qint64>(summary.value("duration_ms").toDouble()))
            .arg(summary.value("cancelled").toBool(false) ? ", cancelled" : "");
    summaryLabel_->setText(text);
    appendLog(QString("Discovery finished: %1").arg(text));
    showMessage(summary.value("cancelled").toBool(false) ? "Discovery cancelled" : "Discovery finished");
}

void MainWindow::onActionFinished(const QJsonObject& result) {
    const bool success = result.value("success").toBool(false);
    const QString action = result.value("action").toString();
    QString message;
    if (!success) {
        message = result.value("error").toString(QString("Action %1 failed").arg(action));
    } else if (action == "load_config") {
        const QJsonObject config = result.value("config").toObject();
        configLabel_->setText(QString("Configuration: %1").arg(result.value("path").toString()));
        message = QString("Configuration loaded (%1 health rules); applies from the next run")
                      .arg(config.value("healthchecks").toObject().size());
    } else if (result.contains("path")) {
        message = QString("Saved: %1").arg(result.value("path").toString());
    } else {
        message = QString("Action %1 completed").arg(action);
    }
    appendLog(message);
    showMessage(message, !success);
}

void MainWindow::appendInstanceRow(const QJsonObject& report, const QString& layerLabel) {
    QStringList adjacencies;
    for (const QJsonValue& value : report.value("adjacencies").toArray()) {
        const QJsonObject adjacency = value.toObject();
        adjacencies.append(
            QString("%1 (%2)").arg(adjacency.value("target").toString(), adjacency.value("relation").toString()));
    }
    const QString outcome = report.value("outcome").toString();
    const QString error = report.value("error").toString();
    CellColors colors;
    const bool colored = colorsForOutcome(outcome, &colors);
    appendRow(
        instanceTable_,
        {
            instanceId(report),
            report.value("server_name").toString(),
            report.value("version").toString(),
            outcome,
            layerLabel,
            stringList(report.value("roles").toArray()).join(", "),
            adjacencies.join("; "),
            QString::number(static_cast<qint64>(report.value("duration_ms").toDouble())),
            error,
        },
        colored ? &colors : nullptr,
        error);
}

void MainWindow::appendPlaceholderRow(const QJsonObject& placeholder, const QString& layerLabel) {
    CellColors colors;
    colorsForOutcome("unvisited", &colors);
    const QString reference = QString("referenced by %1 (%2)")
                                  .arg(placeholder.value("first_seen_from").toString(),
                                       placeholder.value("relation").toString());
    appendRow(
        instanceTable_,
        {instanceId(placeholder), QString(), QString(), "unvisited", layerLabel, QString(), reference, QString(), QString()},
        &colors,
        "Referenced by an adjacency but not in the seed list; not polled.");
}

void MainWindow::appendHealthRows(const QJsonObject& report) {
    const QString instance = instanceId(report);
    const QJsonObject health = report.value("health").toObject();
    for (auto it = health.constBegin(); it != health.constEnd(); ++it) {
        const QJsonObject reading = it.value().toObject();
        const QString status = reading.value("status").toString();
        CellColors colors;
        const bool colored = colorsForHealth(status, &colors);
        appendRow(
            healthTable_,
            {instance, it.key(), reading.value("value").toString(), status},
            colored ? &colors : nullptr);
    }
}

void MainWindow::renderResult(const QJsonObject& result, const QJsonObject& topology) {
    QMap<QString, QString> layerById;
    for (const QJsonValue& value : topology.value("layers").toArray()) {
        const QJsonObject layer = value.toObject();
        for (const QJsonValue& member : layer.value("nodes").toArray()) {
            layerById.insert(member.toString(), layer.value("label").toString());
        }
    }

    instanceTable_->setRowCount(0);
    healthTable_->setRowCount(0);
    for (const QJsonValue& value : result.value("reports").toArray()) {
        const QJsonObject report = value.toObject();
        appendInstanceRow(report, layerById.value(instanceId(report)));
        appendHealthRows(report);
    }
    for (const QJsonValue& value : result.value("discovered").toArray()) {
        const QJsonObject placeholder = value.toObject();
        appendPlaceholderRow(placeholder, layerById.value(instanceId(placeholder)));
    }
    instanceTable_->resizeColumnsToContents();
    healthTable_->resizeColumnsToContents();
}

void MainWindow::renderTopology(const QJsonObject& topology) {
    topologyTree_->clear();
    QMap<QString, QJsonObject> nodesById;
    for (const QJsonValue& value : topology.value("nodes").toArray()) {
        const QJsonObject node = value.toObject();
        nodesById.insert(node.value("id").toString(), node);
    }

    for (const QJsonValue& value : topology.value("layers").toArray()) {
        const QJsonObject layer = value.toObject();
        const QJsonArray members = layer.value("nodes").toArray();
        auto* layerItem = new QTreeWidgetItem(
            topologyTree_,
            {QString("%1. %2").arg(layer.value("rank").toInt()).arg(layer.value("label").toString()),
             QString("%1 node(s)").arg(members.size()),
             QString()});
        layerItem->setForeground(0, QBrush(QColor(layer.value("color").toString("#e3e7ec"))));
        for (const QJsonValue& member : members) {
            const QJsonObject node = nodesById.value(member.toString());
            const QString state = node.value("state").toString();
            QString label = node.value("label").toString();
            if (label != member.toString()) {
                label = QString("%1 (%2)").arg(label, member.toString());
            }
            auto* nodeItem = new QTreeWidgetItem(
                layerItem,
                {label, state, stringList(node.value("roles").toArray()).join(", ")});
            CellColors colors;
            if (colorsForOutcome(state, &colors)) {
                nodeItem->setForeground(0, QBrush(colors.foreground));
                nodeItem->setForeground(1, QBrush(colors.foreground));
            }
            const QString error = node.value("error").toString();
            if (!error.isEmpty()) {
                nodeItem->setToolTip(0, error);
                nodeItem->setToolTip(1, error);
            }
        }
    }
    topologyTree_->expandAll();
    topologyTree_->resizeColumnToContents(0);

    edgeTable_->setRowCount(0);
    for (const QJsonValue& value : topology.value("edges").toArray()) {
        const QJsonObject edge = value.toObject();
        appendRow(
            edgeTable_,
            {
                edge.value("from").toString(),
                edge.value("to").toString(),
                stringList(edge.value("relations").toArray()).join(", "),
            },
            nullptr);
    }
    edgeTable_->resizeColumnsToContents();
}

void MainWindow::requestExport(const QString& action, const QString& format, const QString& filter) {
    const QString ts = QDateTime::currentDateTimeUtc().toString("yyyyMMdd_HHmmss");
    const QString stem = action == "export_topology" ? "splunkscope_topology" : "splunkscope_discovery";
    const QString suggested = QDir(QDir::currentPath()).filePath(QString("reports/%1_%2.%3").arg(stem, ts, format));
    const QString path = QFileDialog::getSaveFileName(this, "Export", suggested, filter);
    if (path.isEmpty()) {
        return;
    }
    emit actionRequested(action, {{"path", path}, {"format", format}});
}

void MainWindow::appendLog(const QString& line) {
    activityLog_->appendPlainText(
        QString("[%1] %2").arg(QDateTime::currentDateTime().toString("HH:mm:ss"), line));
}

void MainWindow::showMessage(const QString& message, bool error) const {
    if (error) {
        statusBar()->showMessage("ERROR: " + message, 8000);
    } else {
        statusBar()->showMessage(message, 5000);
    }
}

}  // namespace sscope
