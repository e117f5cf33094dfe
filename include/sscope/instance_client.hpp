#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>
#include <utility>

#include "sscope/instance_key.hpp"

namespace sscope {

enum class ClientErrorKind {
    None,
    Connect,
    Auth,
    Timeout,
    Fetch,
    Parse,
    Cancelled,
};

QString clientErrorKindName(ClientErrorKind kind);

template <typename T>
struct ClientResult {
    std::optional<T> value;
    ClientErrorKind error = ClientErrorKind::None;
    QString message;

    [[nodiscard]] bool success() const { return value.has_value(); }

    static ClientResult ok(T result) {
        ClientResult out;
        out.value = std::move(result);
        return out;
    }

    static ClientResult failure(ClientErrorKind kind, QString text) {
        ClientResult out;
        out.error = kind;
        out.message = std::move(text);
        return out;
    }
};

struct ServerInfo {
    QString serverName;
    QString guid;
    QString version;
    QString product;
    QString os;
    int cores = 0;
    qint64 ramMb = 0;
    qint64 startupTimeEpoch = 0;

    // From server/settings; unset when that call did not answer.
    QString splunkHome;
    std::optional<bool> webEnabled;
    std::optional<bool> webSslEnabled;
    std::optional<int> webPort;
};

// Live connection to one instance. Fact calls reuse it; a failed fact call
// leaves it valid.
struct SessionHandle {
    InstanceKey key;
    QString username;
    QString password;
    int timeoutMs = 8000;
    ServerInfo server;
    // Set when server/info answered but server/settings did not.
    ClientErrorKind settingsError = ClientErrorKind::None;
    QString settingsMessage;
};

// Raw peer reference as reported by the instance, before normalisation.
struct PeerReference {
    QString uri;
    QString relation;
};

struct DeploymentInfo {
    QString deploymentServerUri;
    bool clientDisabled = false;
};

struct ClusterInfo {
    QString mode;
    QString site;
    QString label;
    QStringList clusterMasterUris;
    QString shcDeployerUri;
    QString shcLabel;

    // Present only when the instance is a cluster master.
    std::optional<bool> maintenanceMode;
    std::optional<bool> rollingRestart;
    std::optional<bool> allDataSearchable;
    std::optional<bool> searchFactorMet;
    std::optional<bool> replicationFactorMet;
    std::optional<int> peerCount;
    std::optional<int> peersSearchable;
    std::optional<int> searchHeadCount;
    std::optional<int> searchHeadsConnected;

    // Present only when the instance is a search head cluster member.
    std::optional<bool> shcRollingRestart;
    std::optional<bool> shcServiceReady;
    std::optional<bool> shcMinPeersJoined;
    std::optional<int> shcMemberCount;
    std::optional<int> shcMembersUp;
};

struct DiskPartition {
    QString mountPoint;
    QString fsType;
    double capacityMb = 0.0;
    double freeMb = 0.0;

    [[nodiscard]] double usedPercent() const {
        return capacityMb > 0.0 ? (capacityMb - freeMb) / capacityMb * 100.0 : 0.0;
    }
};

struct ResourceUsage {
    QVector<DiskPartition> partitions;
    std::optional<double> cpuUsagePct;
    std::optional<double> memUsagePct;
    std::optional<double> swapUsagePct;
};

struct InstanceMessage {
    QString title;
    QString severity;
    QString text;
    qint64 createdEpoch = 0;
};

// Narrow view of one splunkd management API. Implementations are used from a
// single thread at a time.
class InstanceClient {
public:
    virtual ~InstanceClient() = default;

    virtual ClientResult<SessionHandle> connect(
        const InstanceKey& key,
        const QString& username,
        const QString& password,
        int timeoutMs) = 0;
    virtual ClientResult<QStringList> getRoles(const SessionHandle& session) = 0;
    virtual ClientResult<QVector<PeerReference>> getAdjacencies(const SessionHandle& session) = 0;
    virtual ClientResult<DeploymentInfo> getDeploymentInfo(const SessionHandle& session) = 0;
    virtual ClientResult<ClusterInfo> getClusterInfo(const SessionHandle& session) = 0;
    virtual ClientResult<ResourceUsage> getDiskUsage(const SessionHandle& session) = 0;
    virtual ClientResult<QVector<InstanceMessage>> getMessages(const SessionHandle& session) = 0;
};

}  // namespace sscope
