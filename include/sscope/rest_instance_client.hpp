#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QString>

#include <optional>

#include "sscope/instance_client.hpp"

namespace sscope {

class CancellationToken;

namespace rest {

// Decoders for splunkd `output_mode=json` feeds. Each returns Parse on a
// malformed body.
ClientResult<QJsonArray> parseFeedEntries(const QByteArray& body);
ClientResult<ServerInfo> parseServerInfo(const QByteArray& body);
ClientResult<QStringList> parseRoles(const QByteArray& body);
bool applyServerSettings(const QByteArray& body, ServerInfo* server, QString* error);
// Entries are resolved through mgmt_uri, host_port_pair and the entry name,
// in that order.
ClientResult<QVector<PeerReference>> parsePeers(const QByteArray& body, const QString& relation);
ClientResult<DeploymentInfo> parseDeploymentInfo(const QByteArray& body);
// clusterMasterUris may still hold `clustermaster:<stanza>` references.
ClientResult<ClusterInfo> parseClusterConfig(const QByteArray& body);
ClientResult<QVector<DiskPartition>> parsePartitions(const QByteArray& body);
ClientResult<QVector<InstanceMessage>> parseMessages(const QByteArray& body);

bool applyShcConfig(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyClusterMasterInfo(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyClusterGeneration(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyClusterPeerCounts(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyClusterSearchHeadCounts(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyShcStatus(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyShcMemberCounts(const QByteArray& body, ClusterInfo* cluster, QString* error);
bool applyHostwide(const QByteArray& body, ResourceUsage* usage, QString* error);

}  // namespace rest

// InstanceClient over the splunkd management port, using curl as transport.
class RestInstanceClient final : public InstanceClient {
public:
    explicit RestInstanceClient(QString curlProgram = "curl");

    ClientResult<SessionHandle> connect(
        const InstanceKey& key,
        const QString& username,
        const QString& password,
        int timeoutMs) override;
    ClientResult<QStringList> getRoles(const SessionHandle& session) override;
    ClientResult<QVector<PeerReference>> getAdjacencies(const SessionHandle& session) override;
    ClientResult<DeploymentInfo> getDeploymentInfo(const SessionHandle& session) override;
    ClientResult<ClusterInfo> getClusterInfo(const SessionHandle& session) override;
    ClientResult<ResourceUsage> getDiskUsage(const SessionHandle& session) override;
    ClientResult<QVector<InstanceMessage>> getMessages(const SessionHandle& session) override;

    static QString buildUrl(const InstanceKey& key, const QString& path, bool jsonOutput = true);

    // Once the token is cancelled every further request fails without
    // starting curl. The token must outlive the client.
    void setCancellationToken(const CancellationToken* token);

private:
    // Body of a 2xx response, or the mapped transport/HTTP failure.
    ClientResult<QByteArray> get(const SessionHandle& session, const QString& path, bool jsonOutput = true) const;
    // Empty value when the instance answers an HTTP error, i.e. the feature is
    // off. Transport, auth and timeout failures are returned as failures.
    ClientResult<std::optional<QByteArray>> getIfEnabled(
        const SessionHandle& session,
        const QString& path,
        bool jsonOutput = true) const;
    ClientResult<QString> resolveClusterMasterUri(const SessionHandle& session, const QString& reference) const;

    QString curlProgram_;
    const CancellationToken* cancel_ = nullptr;
};

}  // namespace sscope
