#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <utility>

#include "sscope/instance_client.hpp"
#include "sscope/instance_report.hpp"
#include "sscope/seed_list.hpp"

namespace sscope::fakes {

// Canned answers for one instance. Sections listed in failingSections answer
// with a Fetch error; Settings fails the server/settings read behind connect.
struct FakeInstance {
    bool reachable = true;
    ClientErrorKind connectError = ClientErrorKind::Connect;
    ServerInfo server;
    QStringList roles;
    QVector<PeerReference> peers;
    DeploymentInfo deployment;
    ClusterInfo cluster;
    ResourceUsage resources;
    QVector<InstanceMessage> messages;
    QVector<ReportSection> failingSections;
};

struct CallCounts {
    int connect = 0;
    int roles = 0;
    int adjacencies = 0;
    int deployment = 0;
    int cluster = 0;
    int resources = 0;
    int messages = 0;

    [[nodiscard]] int factCalls() const { return roles + adjacencies + deployment + cluster + resources + messages; }
};

// Programmable InstanceClient. Unknown keys refuse the connection.
class FakeInstanceClient final : public InstanceClient {
public:
    void setInstance(const InstanceKey& key, FakeInstance instance) { instances_.insert(key, std::move(instance)); }

    [[nodiscard]] CallCounts calls(const InstanceKey& key) const { return calls_.value(key); }
    [[nodiscard]] const QVector<InstanceKey>& connectOrder() const { return connectOrder_; }

    // Invoked after every connect attempt, before the answer is returned.
    std::function<void(const InstanceKey&)> onConnect;

    ClientResult<SessionHandle> connect(
        const InstanceKey& key,
        const QString& username,
        const QString& password,
        int timeoutMs) override {
        calls_[key].connect++;
        connectOrder_.append(key);
        if (onConnect) {
            onConnect(key);
        }
        const auto it = instances_.constFind(key);
        if (it == instances_.constEnd()) {
            return ClientResult<SessionHandle>::failure(ClientErrorKind::Connect, "connection refused");
        }
        if (!it->reachable) {
            return ClientResult<SessionHandle>::failure(it->connectError, "instance did not answer");
        }
        SessionHandle session;
        session.key = key;
        session.username = username;
        session.password = password;
        session.timeoutMs = timeoutMs;
        session.server = it->server;
        if (it->failingSections.contains(ReportSection::Settings)) {
            session.server.webEnabled.reset();
            session.server.webSslEnabled.reset();
            session.server.webPort.reset();
            session.settingsError = ClientErrorKind::Fetch;
            session.settingsMessage = "settings endpoint returned HTTP 500";
        }
        return ClientResult<SessionHandle>::ok(session);
    }

    ClientResult<QStringList> getRoles(const SessionHandle& session) override {
        calls_[session.key].roles++;
        return answer(session.key, ReportSection::Roles, &FakeInstance::roles);
    }

    ClientResult<QVector<PeerReference>> getAdjacencies(const SessionHandle& session) override {
        calls_[session.key].adjacencies++;
        return answer(session.key, ReportSection::Adjacencies, &FakeInstance::peers);
    }

    ClientResult<DeploymentInfo> getDeploymentInfo(const SessionHandle& session) override {
        calls_[session.key].deployment++;
        return answer(session.key, ReportSection::Deployment, &FakeInstance::deployment);
    }

    ClientResult<ClusterInfo> getClusterInfo(const SessionHandle& session) override {
        calls_[session.key].cluster++;
        return answer(session.key, ReportSection::Cluster, &FakeInstance::cluster);
    }

    ClientResult<ResourceUsage> getDiskUsage(const SessionHandle& session) override {
        calls_[session.key].resources++;
        return answer(session.key, ReportSection::Resources, &FakeInstance::resources);
    }

    ClientResult<QVector<InstanceMessage>> getMessages(const SessionHandle& session) override {
        calls_[session.key].messages++;
        return answer(session.key, ReportSection::Messages, &FakeInstance::messages);
    }

private:
    template <typename T>
    ClientResult<T> answer(const InstanceKey& key, ReportSection section, T FakeInstance::*field) const {
        const FakeInstance instance = instances_.value(key);
        if (instance.failingSections.contains(section)) {
            return ClientResult<T>::failure(
                ClientErrorKind::Fetch,
                QString("%1 endpoint returned HTTP 500").arg(reportSectionName(section)));
        }
        return ClientResult<T>::ok(instance.*field);
    }

    QHash<InstanceKey, FakeInstance> instances_;
    QHash<InstanceKey, CallCounts> calls_;
    QVector<InstanceKey> connectOrder_;
};

// Seed entry with the credentials every fixture uses.
inline SeedEntry seed(const QString& address, int port = kDefaultManagementPort, int lineNumber = 0) {
    SeedEntry entry;
    entry.key = InstanceKey(address, port);
    entry.username = "admin";
    entry.password = "changeme";
    entry.lineNumber = lineNumber;
    return entry;
}

inline ServerInfo server(const QString& name, const QString& version = "9.1.2") {
    ServerInfo info;
    info.serverName = name;
    info.guid = QString("guid-%1").arg(name);
    info.version = version;
    info.cores = 16;
    info.ramMb = 65536;
    info.splunkHome = "/opt/splunk";
    info.webEnabled = true;
    info.webSslEnabled = true;
    info.webPort = 8000;
    return info;
}

}  // namespace sscope::fakes
