#include <gtest/gtest.h>

#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>

#include <memory>

#include "fake_instance_client.hpp"
#include "sscope/discovery_worker.hpp"

using sscope::DiscoveryWorker;
using sscope::InstanceKey;
using sscope::ToolConfig;
using sscope::fakes::FakeInstance;
using sscope::fakes::FakeInstanceClient;

namespace {

class DiscoveryWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
        auto client = std::make_unique<FakeInstanceClient>();
        FakeInstance searchHead;
        searchHead.server = sscope::fakes::server("sh01");
        searchHead.roles = {"search_head"};
        searchHead.peers = {{"idx01:8089", "distributed search peer"}, {"idx07:8089", "distributed search peer"}};
        client->setInstance(InstanceKey("sh01", 8089), searchHead);
        FakeInstance indexer;
        indexer.server = sscope::fakes::server("idx01");
        indexer.roles = {"indexer"};
        client->setInstance(InstanceKey("idx01", 8089), indexer);

        worker_ = std::make_unique<DiscoveryWorker>(
            std::make_shared<const ToolConfig>(ToolConfig::defaults()),
            std::move(client));
        QObject::connect(worker_.get(), &DiscoveryWorker::instanceCompleted, [this](const QJsonObject& progress) {
            progress_.append(progress);
        });
        QObject::connect(worker_.get(), &DiscoveryWorker::discoveryFinished, [this](const QJsonObject& summary) {
            summary_ = summary;
        });
        QObject::connect(worker_.get(), &DiscoveryWorker::actionFinished, [this](const QJsonObject& result) {
            action_ = result;
        });
    }

    QString writeFile(const QString& name, const QByteArray& data) const {
        const QString path = dir_.filePath(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(data);
        }
        return path;
    }

    QTemporaryDir dir_;
    std::unique_ptr<DiscoveryWorker> worker_;
    QVector<QJsonObject> progress_;
    QJsonObject summary_;
    QJsonObject action_;
};

}  // namespace

TEST_F(DiscoveryWorkerTest, RunReportsProgressAndSummary) {
    worker_->runDiscovery(writeFile("seeds.csv", "address,port,username,password\nsh01,8089,,\nidx01,8089,,\n"));

    ASSERT_EQ(progress_.size(), 2);
    EXPECT_EQ(progress_.last().value("completed").toInt(), 2);
    EXPECT_EQ(progress_.last().value("total").toInt(), 2);

    ASSERT_TRUE(summary_.value("success").toBool()) << summary_.value("error").toString().toStdString();
    EXPECT_EQ(summary_.value("polled").toInt(), 2);
    EXPECT_EQ(summary_.value("placeholders").toInt(), 1);
    EXPECT_EQ(summary_.value("seed_entries").toInt(), 2);
    EXPECT_EQ(summary_.value("topology").toObject().value("nodes").toArray().size(), 3);
    EXPECT_EQ(worker_->lastGraph().nodes.size(), 3);
}

TEST_F(DiscoveryWorkerTest, RejectedSeedListNeverPolls) {
    worker_->runDiscovery(writeFile("seeds.csv", "address,port\nsh01,8089\n"));
    EXPECT_FALSE(summary_.value("success").toBool());
    EXPECT_TRUE(summary_.value("error").toString().contains("header"));
    EXPECT_TRUE(progress_.isEmpty());
}

// A cancel that arrives while the run is still queued stops it.
TEST_F(DiscoveryWorkerTest, CancelBeforeRunStartsIsHonoured) {
    const QString seeds = writeFile("seeds.csv", "address,port,username,password\nsh01,8089,,\nidx01,8089,,\n");
    worker_->resetCancel();
    worker_->requestCancel();
    worker_->runDiscovery(seeds);

    EXPECT_TRUE(progress_.isEmpty());
    EXPECT_TRUE(summary_.value("cancelled").toBool());
    EXPECT_EQ(summary_.value("polled").toInt(), 0);

    worker_->resetCancel();
    worker_->runDiscovery(seeds);
    EXPECT_FALSE(summary_.value("cancelled").toBool());
    EXPECT_EQ(summary_.value("polled").toInt(), 2);
}

TEST_F(DiscoveryWorkerTest, ExportsNeedAResult) {
    worker_->runAction("export_csv", {{"path", dir_.filePath("report.csv")}});
    EXPECT_FALSE(action_.value("success").toBool());
    EXPECT_EQ(action_.value("action").toString(), QString("export_csv"));
}

TEST_F(DiscoveryWorkerTest, ExportsAfterRun) {
    worker_->runDiscovery(writeFile("seeds.csv", "address,port,username,password\nsh01,8089,,\nidx01,8089,,\n"));
    ASSERT_TRUE(summary_.value("success").toBool());

    const QString csvPath = dir_.filePath("out/report.csv");
    worker_->runAction("export_csv", {{"path", csvPath}});
    ASSERT_TRUE(action_.value("success").toBool()) << action_.value("error").toString().toStdString();
    EXPECT_TRUE(QFile::exists(csvPath));

    const QString dotPath = dir_.filePath("out/topology.dot");
    worker_->runAction("export_topology", {{"path", dotPath}, {"format", "dot"}});
    ASSERT_TRUE(action_.value("success").toBool());
    QFile dot(dotPath);
    ASSERT_TRUE(dot.open(QIODevice::ReadOnly));
    EXPECT_TRUE(dot.readAll().contains("idx07:8089"));

    worker_->runAction("export_topology", {{"path", dir_.filePath("out/topology.gif")}, {"format", "gif"}});
    EXPECT_FALSE(action_.value("success").toBool());
}

TEST_F(DiscoveryWorkerTest, LoadConfigAppliesToLaterRuns) {
    const QString good = writeFile("splunkscope.json", R"({"main": {"default_port": 9089, "log_file": ""}})");
    worker_->runAction("load_config", {{"path", good}});
    ASSERT_TRUE(action_.value("success").toBool()) << action_.value("error").toString().toStdString();
    EXPECT_EQ(worker_->config()->defaultPort(), 9089);
    EXPECT_EQ(action_.value("config").toObject().value("main").toObject().value("default_port").toInt(), 9089);

    worker_->runAction("load_config", {{"path", writeFile("bad.json", "[]")}});
    EXPECT_FALSE(action_.value("success").toBool());
    EXPECT_EQ(worker_->config()->defaultPort(), 9089);
}

TEST_F(DiscoveryWorkerTest, UnknownActionFails) {
    worker_->runAction("reboot_everything", {});
    EXPECT_FALSE(action_.value("success").toBool());
    EXPECT_EQ(action_.value("action").toString(), QString("reboot_everything"));
}
