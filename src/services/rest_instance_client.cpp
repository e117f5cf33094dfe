#include "sscope/rest_instance_client.hpp"

#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QPair>

#include <initializer_list>
#include <optional>
#include <utility>

#include "sscope/cancellation_token.hpp"
#include "sscope/command_runner.hpp"
#include "sscope/instance_report.hpp"
#include "sscope/telemetry.hpp"

namespace sscope {

namespace rest {

namespace {

constexpr int kCurlTimeoutExitCode = 28;
constexpr int kCurlGraceMs = 2000;

// Properties endpoints report values as plain strings or as {"$text": ...}.
QString textValue(const QJsonValue& value) {
    if (value.isObject()) {
        return value.toObject().value("$text").toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble(), 'g', 15);
    }
    if (value.isBool()) {
        return value.toBool() ? "1" : "0";
    }
    return value.toString();
}

std::optional<bool> flagValue(const QJsonValue& value) {
    if (value.isBool()) {
        return value.toBool();
    }
    if (value.isDouble()) {
        return value.toDouble() != 0.0;
    }
    if (value.isString()) {
        const QString text = value.toString().trimmed().toLower();
        if (text == "1" || text == "true") {
            return true;
        }
        if (text == "0" || text == "false") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<double> numberValue(const QJsonValue& value) {
    if (value.isDouble()) {
        return value.toDouble();
    }
    bool ok = false;
    const double parsed = textValue(value).trimmed().toDouble(&ok);
    return ok ? std::optional<double>(parsed) : std::nullopt;
}

QJsonObject contentOf(const QJsonValue& entry) {
    return entry.toObject().value("content").toObject();
}

QString entryName(const QJsonValue& entry) {
    const QJsonObject object = entry.toObject();
    const QString name = object.value("name").toString();
    return name.isEmpty() ? object.value("title").toString() : name;
}

// Single-entry feeds (server/info, cluster/config, ...) keep their payload in
// the first entry.
ClientResult<QJsonObject> firstContent(const QByteArray& body) {
    const ClientResult<QJsonArray> entries = parseFeedEntries(body);
    if (!entries.success()) {
        return ClientResult<QJsonObject>::failure(entries.error, entries.message);
    }
    if (entries.value->isEmpty()) {
        return ClientResult<QJsonObject>::failure(ClientErrorKind::Parse, "Response feed has no entries.");
    }
    return ClientResult<QJsonObject>::ok(contentOf(entries.value->first()));
}

bool entriesOrError(const QByteArray& body, QJsonArray* out, QString* error) {
    const ClientResult<QJsonArray> entries = parseFeedEntries(body);
    if (!entries.success()) {
        if (error != nullptr) {
            *error = entries.message;
        }
        return false;
    }
    *out = *entries.value;
    return true;
}

bool contentOrError(const QByteArray& body, QJsonObject* out, QString* error) {
    const ClientResult<QJsonObject> content = firstContent(body);
    if (!content.success()) {
        if (error != nullptr) {
            *error = content.message;
        }
        return false;
    }
    *out = *content.value;
    return true;
}

QStringList stringList(const QJsonValue& value) {
    QStringList out;
    if (value.isArray()) {
        for (const QJsonValue& item : value.toArray()) {
            const QString text = item.toString().trimmed();
            if (!text.isEmpty()) {
                out.append(text);
            }
        }
    } else {
        for (const QString& item : textValue(value).split(',', Qt::SkipEmptyParts)) {
            const QString text = item.trimmed();
            if (!text.isEmpty()) {
                out.append(text);
            }
        }
    }
    return out;
}

}  // namespace

ClientResult<QJsonArray> parseFeedEntries(const QByteArray& body) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return ClientResult<QJsonArray>::failure(
            ClientErrorKind::Parse,
            QString("Response is not a JSON object: %1").arg(parseError.errorString()));
    }
    const QJsonValue entries = doc.object().value("entry");
    if (entries.isUndefined() || entries.isNull()) {
        return ClientResult<QJsonArray>::ok({});
    }
    if (entries.isObject()) {
        return ClientResult<QJsonArray>::ok(QJsonArray{entries});
    }
    if (!entries.isArray()) {
        return ClientResult<QJsonArray>::failure(ClientErrorKind::Parse, "Response field 'entry' is not a list.");
    }
    return ClientResult<QJsonArray>::ok(entries.toArray());
}

ClientResult<ServerInfo> parseServerInfo(const QByteArray& body) {
    const ClientResult<QJsonObject> content = firstContent(body);
    if (!content.success()) {
        return ClientResult<ServerInfo>::failure(content.error, content.message);
    }
    const QJsonObject& info = *content.value;

    ServerInfo server;
    server.serverName = info.value("serverName").toString();
    server.guid = info.value("guid").toString();
    server.version = info.value("version").toString();
    server.product = info.value("product_type").toString();
    const QString arch = info.value("cpu_arch").toString();
    const QString extended = info.value("os_name_extended").toString();
    if (!extended.isEmpty()) {
        server.os = QString("%1 %2").arg(extended, arch).trimmed();
    } else {
        server.os = QStringList{
            info.value("os_name").toString(),
            info.value("os_version").toString(),
            arch,
        }
                        .join(' ')
                        .simplified();
    }
    server.cores = static_cast<int>(numberValue(info.value("numberOfCores")).value_or(0.0));
    server.ramMb = static_cast<qint64>(numberValue(info.value("physicalMemoryMB")).value_or(0.0));
    server.startupTimeEpoch = static_cast<qint64>(numberValue(info.value("startup_time")).value_or(0.0));

    if (server.guid.isEmpty() && server.version.isEmpty()) {
        return ClientResult<ServerInfo>::failure(ClientErrorKind::Parse, "server/info carries no guid or version.");
    }
    return ClientResult<ServerInfo>::ok(server);
}

bool applyServerSettings(const QByteArray& body, ServerInfo* server, QString* error) {
    QJsonObject settings;
    if (!contentOrError(body, &settings, error)) {
        return false;
    }
    server->splunkHome = settings.value("SPLUNK_HOME").toString();
    server->webEnabled = flagValue(settings.value("startwebserver"));
    server->webSslEnabled = flagValue(settings.value("enableSplunkWebSSL"));
    if (const auto port = numberValue(settings.value("httpport"))) {
        server->webPort = static_cast<int>(*port);
    }
    return true;
}

ClientResult<QStringList> parseRoles(const QByteArray& body) {
    const ClientResult<QJsonObject> content = firstContent(body);
    if (!content.success()) {
        return ClientResult<QStringList>::failure(content.error, content.message);
    }
    const QJsonValue roleList = content.value->value("role_list");
    if (roleList.isUndefined()) {
        return ClientResult<QStringList>::failure(ClientErrorKind::Parse, "server/roles carries no role_list.");
    }
    QStringList roles = stringList(roleList);
    roles.removeDuplicates();
    roles.sort();
    return ClientResult<QStringList>::ok(roles);
}

ClientResult<QVector<PeerReference>> parsePeers(const QByteArray& body, const QString& relation) {
    const ClientResult<QJsonArray> entries = parseFeedEntries(body);
    if (!entries.success()) {
        return ClientResult<QVector<PeerReference>>::failure(entries.error, entries.message);
    }
    QVector<PeerReference> peers;
    for (const QJsonValue& entry : *entries.value) {
        const QJsonObject content = contentOf(entry);
        // peerName is a server name, not an address; distributed peers keep
        // their host:port in the entry name.
        QString uri;
        for (const char* field : {"mgmt_uri", "host_port_pair"}) {
            uri = content.value(field).toString().trimmed();
            if (!uri.isEmpty()) {
                break;
            }
        }
        if (uri.isEmpty()) {
            uri = entryName(entry).trimmed();
        }
        if (!uri.isEmpty()) {
            peers.append(PeerReference{uri, relation});
        }
    }
    return ClientResult<QVector<PeerReference>>::ok(peers);
}

ClientResult<DeploymentInfo> parseDeploymentInfo(const QByteArray& body) {
    const ClientResult<QJsonArray> entries = parseFeedEntries(body);
    if (!entries.success()) {
        return ClientResult<DeploymentInfo>::failure(entries.error, entries.message);
    }
    DeploymentInfo info;
    for (const QJsonValue& entry : *entries.value) {
        const QString key = entryName(entry);
        const QJsonValue content = entry.toObject().value("content");
        if (key == "targetUri") {
            info.deploymentServerUri = textValue(content).trimmed();
        } else if (key == "disabled") {
            info.clientDisabled = flagValue(QJsonValue(textValue(content))).value_or(false);
        }
    }
    return ClientResult<DeploymentInfo>::ok(info);
}

ClientResult<ClusterInfo> parseClusterConfig(const QByteArray& body) {
    const ClientResult<QJsonObject> content = firstContent(body);
    if (!content.success()) {
        return ClientResult<ClusterInfo>::failure(content.error, content.message);
    }
    const QJsonObject& config = *content.value;

    ClusterInfo cluster;
    cluster.mode = config.value("mode").toString();
    cluster.site = config.value("site").toString();
    cluster.label = config.value("cluster_label").toString();
    if (cluster.mode != "disabled") {
        QJsonValue uris = config.value("master_uri");
        if (uris.isUndefined()) {
            uris = config.value("manager_uri");
        }
        for (const QString& uri : stringList(uris)) {
            if (uri != "?") {
                cluster.clusterMasterUris.append(uri);
            }
        }
    }
    return ClientResult<ClusterInfo>::ok(cluster);
}

ClientResult<QVector<DiskPartition>> parsePartitions(const QByteArray& body) {
    const ClientResult<QJsonArray> entries = parseFeedEntries(body);
    if (!entries.success()) {
        return ClientResult<QVector<DiskPartition>>::failure(entries.error, entries.message);
    }
    QVector<DiskPartition> partitions;
    for (const QJsonValue& entry : *entries.value) {
        const QJsonObject content = contentOf(entry);
        const std::optional<double> capacity = numberValue(content.value("capacity"));
        const std::optional<double> free = numberValue(content.value("free"));
        if (!capacity.has_value() || !free.has_value()) {
            return ClientResult<QVector<DiskPartition>>::failure(
                ClientErrorKind::Parse,
                QString("Partition '%1' lacks capacity or free space.").arg(entryName(entry)));
        }
        DiskPartition partition;
        partition.mountPoint = content.value("mount_point").toString(entryName(entry));
        partition.fsType = content.value("fs_type").toString();
        partition.capacityMb = *capacity;
        partition.freeMb = *free;
        partitions.append(partition);
    }
    return ClientResult<QVector<DiskPartition>>::ok(partitions);
}

ClientResult<QVector<InstanceMessage>> parseMessages(const QByteArray& body) {
    const ClientResult<QJsonArray> entries = parseFeedEntries(body);
    if (!entries.success()) {
        return ClientResult<QVector<InstanceMessage>>::failure(entries.error, entries.message);
    }
    QVector<InstanceMessage> messages;
    for (const QJsonValue& entry : *entries.value) {
        const QJsonObject content = contentOf(entry);
        InstanceMessage message;
        message.title = entryName(entry);
        message.severity = content.value("severity").toString().toLower();
        message.text = content.value("message").toString();
        message.createdEpoch =
            static_cast<qint64>(numberValue(content.value("timeCreated_epochSecs")).value_or(0.0));
        messages.append(message);
    }
    return ClientResult<QVector<InstanceMessage>>::ok(messages);
}

bool applyShcConfig(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonObject config;
    if (!contentOrError(body, &config, error)) {
        return false;
    }
    const QString fetchUrl = config.value("conf_deploy_fetch_url").toString().trimmed();
    if (fetchUrl != "?") {
        cluster->shcDeployerUri = fetchUrl;
    }
    cluster->shcLabel = config.value("shcluster_label").toString();
    return true;
}

bool applyClusterMasterInfo(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonObject info;
    if (!contentOrError(body, &info, error)) {
        return false;
    }
    cluster->maintenanceMode = flagValue(info.value("maintenance_mode"));
    cluster->rollingRestart = flagValue(info.value("rolling_restart_flag"));
    return true;
}

bool applyClusterGeneration(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonObject generation;
    if (!contentOrError(body, &generation, error)) {
        return false;
    }
    const QJsonValue pendingReason = generation.value("pending_last_reason");
    cluster->allDataSearchable =
        pendingReason.isUndefined() || pendingReason.isNull() || pendingReason.toString().isEmpty();
    cluster->searchFactorMet = flagValue(generation.value("search_factor_met"));
    cluster->replicationFactorMet = flagValue(generation.value("replication_factor_met"));
    return true;
}

bool applyClusterPeerCounts(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonArray entries;
    if (!entriesOrError(body, &entries, error)) {
        return false;
    }
    int searchable = 0;
    for (const QJsonValue& entry : entries) {
        if (flagValue(contentOf(entry).value("is_searchable")).value_or(false)) {
            searchable++;
        }
    }
    cluster->peerCount = entries.size();
    cluster->peersSearchable = searchable;
    return true;
}

bool applyClusterSearchHeadCounts(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonArray entries;
    if (!entriesOrError(body, &entries, error)) {
        return false;
    }
    int connected = 0;
    for (const QJsonValue& entry : entries) {
        if (contentOf(entry).value("status").toString().compare("Connected", Qt::CaseInsensitive) == 0) {
            connected++;
        }
    }
    cluster->searchHeadCount = entries.size();
    cluster->searchHeadsConnected = connected;
    return true;
}

bool applyShcStatus(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonObject status;
    if (!contentOrError(body, &status, error)) {
        return false;
    }
    const QJsonObject captain = status.value("captain").toObject();
    if (captain.isEmpty()) {
        if (error != nullptr) {
            *error = "shcluster/status carries no captain.";
        }
        return false;
    }
    cluster->shcRollingRestart = flagValue(captain.value("rolling_restart_flag"));
    cluster->shcServiceReady = flagValue(captain.value("service_ready_flag"));
    cluster->shcMinPeersJoined = flagValue(captain.value("min_peers_joined_flag"));
    return true;
}

bool applyShcMemberCounts(const QByteArray& body, ClusterInfo* cluster, QString* error) {
    QJsonArray entries;
    if (!entriesOrError(body, &entries, error)) {
        return false;
    }
    int up = 0;
    for (const QJsonValue& entry : entries) {
        if (contentOf(entry).value("status").toString().compare("Up", Qt::CaseInsensitive) == 0) {
            up++;
        }
    }
    cluster->shcMemberCount = entries.size();
    cluster->shcMembersUp = up;
    return true;
}

bool applyHostwide(const QByteArray& body, ResourceUsage* usage, QString* error) {
    QJsonObject hostwide;
    if (!contentOrError(body, &hostwide, error)) {
        return false;
    }
    if (const auto idle = numberValue(hostwide.value("cpu_idle_pct"))) {
        usage->cpuUsagePct = 100.0 - *idle;
    }
    const auto mem = numberValue(hostwide.value("mem"));
    const auto memUsed = numberValue(hostwide.value("mem_used"));
    if (mem.has_value() && memUsed.has_value() && *mem > 0.0) {
        usage->memUsagePct = *memUsed / *mem * 100.0;
    }
    const auto swap = numberValue(hostwide.value("swap"));
    const auto swapUsed = numberValue(hostwide.value("swap_used"));
    if (swap.has_value() && swapUsed.has_value() && *swap > 0.0) {
        usage->swapUsagePct = *swapUsed / *swap * 100.0;
    }
    return true;
}

}  // namespace rest

namespace {

QByteArray curlCredentials(const QString& username, const QString& password) {
    QString userPass = username + ":" + password;
    userPass.replace("\\", "\\\\");
    userPass.replace("\"", "\\\"");
    return QString("user = \"%1\"\n").arg(userPass).toUtf8();
}

}  // namespace

RestInstanceClient::RestInstanceClient(QString curlProgram)
    : curlProgram_(std::move(curlProgram)) {}

QString RestInstanceClient::buildUrl(const InstanceKey& key, const QString& path, bool jsonOutput) {
    QString url = QString("https://%1%2").arg(key.toString(), path);
    if (jsonOutput) {
        url += "?output_mode=json&count=-1";
    }
    return url;
}

ClientResult<QByteArray> RestInstanceClient::get(
    const SessionHandle& session,
    const QString& path,
    bool jsonOutput) const {
    if (cancel_ != nullptr && cancel_->isCancelled()) {
        return ClientResult<QByteArray>::failure(ClientErrorKind::Cancelled, QString("%1 skipped, run cancelled").arg(path));
    }
    QElapsedTimer elapsed;
    elapsed.start();
    Telemetry::instance().incrementCounter("rest.requests");
    Telemetry::instance().recordRequest();

    const int timeoutMs = qMax(1000, session.timeoutMs);
    const QStringList args = {
        "--silent",
        "--show-error",
        "--insecure",
        "--globoff",
        "--max-time", QString::number(qMax(1, timeoutMs / 1000)),
        "--config", "-",
        "--write-out", "\n%{http_code}",
        buildUrl(session.key, path, jsonOutput),
    };
    const CommandResult result = CommandRunner::run(
        curlProgram_,
        args,
        timeoutMs + kCurlGraceMs,
        curlCredentials(session.username, session.password));
    Telemetry::instance().recordDurationMs("rest.duration_ms", elapsed.elapsed());

    const auto fail = [&](ClientErrorKind kind, const QString& message) {
        Telemetry::instance().incrementCounter("rest.failures");
        if (kind == ClientErrorKind::Timeout) {
            Telemetry::instance().incrementCounter("rest.timeouts");
        }
        return ClientResult<QByteArray>::failure(kind, QString("%1 %2").arg(path, message));
    };

    if (result.failedToStart) {
        return fail(ClientErrorKind::Connect, result.stderrText);
    }
    if (result.timedOut || result.exitCode == kCurlTimeoutExitCode) {
        return fail(ClientErrorKind::Timeout, QString("timed out after %1 ms").arg(timeoutMs));
    }
    if (result.exitCode != 0) {
        return fail(
            ClientErrorKind::Connect,
            QString("curl exit %1: %2").arg(result.exitCode).arg(result.stderrText.trimmed()));
    }

    const int split = result.stdoutData.lastIndexOf('\n');
    const QByteArray body = split >= 0 ? result.stdoutData.left(split) : QByteArray();
    const int status = result.stdoutData.mid(split + 1).trimmed().toInt();
    if (status == 401) {
        return fail(ClientErrorKind::Auth, "rejected the credentials (HTTP 401)");
    }
    if (status < 200 || status >= 300) {
        return fail(ClientErrorKind::Fetch, QString("returned HTTP %1").arg(status));
    }
    return ClientResult<QByteArray>::ok(body);
}

void RestInstanceClient::setCancellationToken(const CancellationToken* token) {
    cancel_ = token;
}

ClientResult<std::optional<QByteArray>> RestInstanceClient::getIfEnabled(
    const SessionHandle& session,
    const QString& path,
    bool jsonOutput) const {
    const ClientResult<QByteArray> body = get(session, path, jsonOutput);
    if (body.success()) {
        return ClientResult<std::optional<QByteArray>>::ok(*body.value);
    }
    // splunkd answers an HTTP error for views of features that are off.
    if (body.error == ClientErrorKind::Fetch) {
        return ClientResult<std::optional<QByteArray>>::ok(std::nullopt);
    }
    return ClientResult<std::optional<QByteArray>>::failure(body.error, body.message);
}

ClientResult<SessionHandle> RestInstanceClient::connect(
    const InstanceKey& key,
    const QString& username,
    const QString& password,
    int timeoutMs) {
    SessionHandle session;
    session.key = key;
    session.username = username;
    session.password = password;
    session.timeoutMs = timeoutMs;

    const ClientResult<QByteArray> body = get(session, "/services/server/info");
    if (!body.success()) {
        const ClientErrorKind kind =
            body.error == ClientErrorKind::Auth || body.error == ClientErrorKind::Timeout ? body.error
                                                                                           : ClientErrorKind::Connect;
        return ClientResult<SessionHandle>::failure(kind, body.message);
    }
    const ClientResult<ServerInfo> server = rest::parseServerInfo(*body.value);
    if (!server.success()) {
        return ClientResult<SessionHandle>::failure(ClientErrorKind::Connect, server.message);
    }
    session.server = *server.value;

    const ClientResult<QByteArray> settings = get(session, "/services/server/settings");
    QString error;
    if (!settings.success()) {
        session.settingsError = settings.error;
        session.settingsMessage = settings.message;
    } else if (!rest::applyServerSettings(*settings.value, &session.server, &error)) {
        session.settingsError = ClientErrorKind::Parse;
        session.settingsMessage = error;
    }
    return ClientResult<SessionHandle>::ok(session);
}

ClientResult<QStringList> RestInstanceClient::getRoles(const SessionHandle& session) {
    const ClientResult<QByteArray> body = get(session, "/services/server/roles");
    if (!body.success()) {
        return ClientResult<QStringList>::failure(body.error, body.message);
    }
    return rest::parseRoles(*body.value);
}

ClientResult<QVector<PeerReference>> RestInstanceClient::getAdjacencies(const SessionHandle& session) {
    const ClientResult<QByteArray> body = get(session, "/services/search/distributed/peers");
    if (!body.success()) {
        return ClientResult<QVector<PeerReference>>::failure(body.error, body.message);
    }
    ClientResult<QVector<PeerReference>> peers = rest::parsePeers(*body.value, relations::kDistributedSearchPeer);
    if (!peers.success()) {
        return peers;
    }

    // Cluster and SHC views answer with an HTTP error when the feature is off.
    const QVector<QPair<QString, QString>> optionalViews = {
        {"/services/cluster/master/peers", relations::kClusterPeer},
        {"/services/cluster/master/searchheads", relations::kClusterSearchHead},
        {"/services/shcluster/member/members", relations::kShcMember},
    };
    for (const auto& view : optionalViews) {
        const ClientResult<std::optional<QByteArray>> optionalBody = getIfEnabled(session, view.first);
        if (!optionalBody.success()) {
            return ClientResult<QVector<PeerReference>>::failure(optionalBody.error, optionalBody.message);
        }
        if (!optionalBody.value->has_value()) {
            continue;
        }
        const ClientResult<QVector<PeerReference>> extra = rest::parsePeers(**optionalBody.value, view.second);
        if (!extra.success()) {
            return extra;
        }
        peers.value->append(*extra.value);
    }
    return peers;
}

ClientResult<DeploymentInfo> RestInstanceClient::getDeploymentInfo(const SessionHandle& session) {
    const ClientResult<QByteArray> body =
        get(session, "/services/properties/deploymentclient/target-broker:deploymentServer");
    if (!body.success()) {
        // No deploymentclient.conf stanza: not a deployment client.
        if (body.error == ClientErrorKind::Fetch) {
            return ClientResult<DeploymentInfo>::ok({});
        }
        return ClientResult<DeploymentInfo>::failure(body.error, body.message);
    }
    return rest::parseDeploymentInfo(*body.value);
}

ClientResult<QString> RestInstanceClient::resolveClusterMasterUri(
    const SessionHandle& session,
    const QString& reference) const {
    static const QString prefix = "clustermaster:";
    if (!reference.startsWith(prefix)) {
        return ClientResult<QString>::ok(reference);
    }
    const ClientResult<std::optional<QByteArray>> body =
        getIfEnabled(session, QString("/services/properties/server/%1/master_uri").arg(reference), false);
    if (!body.success()) {
        return ClientResult<QString>::failure(body.error, body.message);
    }
    // A stanza without master_uri leaves the reference unresolved.
    return ClientResult<QString>::ok(body.value->has_value() ? QString::fromUtf8(**body.value).trimmed() : QString());
}

ClientResult<ClusterInfo> RestInstanceClient::getClusterInfo(const SessionHandle& session) {
    const ClientResult<QByteArray> configBody = get(session, "/services/cluster/config");
    if (!configBody.success()) {
        return ClientResult<ClusterInfo>::failure(configBody.error, configBody.message);
    }
    ClientResult<ClusterInfo> result = rest::parseClusterConfig(*configBody.value);
    if (!result.success()) {
        return result;
    }
    ClusterInfo& cluster = *result.value;

    QStringList resolved;
    for (const QString& reference : cluster.clusterMasterUris) {
        const ClientResult<QString> uri = resolveClusterMasterUri(session, reference);
        if (!uri.success()) {
            return ClientResult<ClusterInfo>::failure(uri.error, uri.message);
        }
        if (!uri.value->isEmpty()) {
            resolved.append(*uri.value);
        }
    }
    cluster.clusterMasterUris = resolved;

    using Apply = bool (*)(const QByteArray&, ClusterInfo*, QString*);
    QString error;
    // Ok(false) when the view is not enabled on this instance.
    const auto applyView = [&](const QString& path, Apply apply) -> ClientResult<bool> {
        const ClientResult<std::optional<QByteArray>> body = getIfEnabled(session, path);
        if (!body.success()) {
            return ClientResult<bool>::failure(body.error, body.message);
        }
        if (!body.value->has_value()) {
            return ClientResult<bool>::ok(false);
        }
        if (!apply(**body.value, &cluster, &error)) {
            return ClientResult<bool>::failure(ClientErrorKind::Parse, QString("%1 %2").arg(path, error));
        }
        return ClientResult<bool>::ok(true);
    };

    const ClientResult<bool> shcConfig = applyView("/services/shcluster/config", rest::applyShcConfig);
    if (!shcConfig.success()) {
        return ClientResult<ClusterInfo>::failure(shcConfig.error, shcConfig.message);
    }

    if (cluster.mode == "master" || cluster.mode == "manager") {
        const QVector<QPair<QString, Apply>> masterViews = {
            {"/services/cluster/master/info", rest::applyClusterMasterInfo},
            {"/services/cluster/master/generation/master", rest::applyClusterGeneration},
            {"/services/cluster/master/peers", rest::applyClusterPeerCounts},
            {"/services/cluster/master/searchheads", rest::applyClusterSearchHeadCounts},
        };
        for (const auto& view : masterViews) {
            const ClientResult<bool> applied = applyView(view.first, view.second);
            if (!applied.success()) {
                return ClientResult<ClusterInfo>::failure(applied.error, applied.message);
            }
        }
    }

    // Without a captain the instance is not an active SHC member.
    const ClientResult<std::optional<QByteArray>> shcStatus = getIfEnabled(session, "/services/shcluster/status");
    if (!shcStatus.success()) {
        return ClientResult<ClusterInfo>::failure(shcStatus.error, shcStatus.message);
    }
    if (shcStatus.value->has_value() && rest::applyShcStatus(**shcStatus.value, &cluster, &error)) {
        const ClientResult<bool> members = applyView("/services/shcluster/member/members", rest::applyShcMemberCounts);
        if (!members.success()) {
            return ClientResult<ClusterInfo>::failure(members.error, members.message);
        }
    }
    return result;
}

ClientResult<ResourceUsage> RestInstanceClient::getDiskUsage(const SessionHandle& session) {
    const ClientResult<QByteArray> body = get(session, "/services/server/status/partitions-space");
    if (!body.success()) {
        return ClientResult<ResourceUsage>::failure(body.error, body.message);
    }
    const ClientResult<QVector<DiskPartition>> partitions = rest::parsePartitions(*body.value);
    if (!partitions.success()) {
        return ClientResult<ResourceUsage>::failure(partitions.error, partitions.message);
    }

    ResourceUsage usage;
    usage.partitions = *partitions.value;
    const ClientResult<std::optional<QByteArray>> hostwide =
        getIfEnabled(session, "/services/server/status/resource-usage/hostwide");
    if (!hostwide.success()) {
        return ClientResult<ResourceUsage>::failure(hostwide.error, hostwide.message);
    }
    QString error;
    if (hostwide.value->has_value() && !rest::applyHostwide(**hostwide.value, &usage, &error)) {
        return ClientResult<ResourceUsage>::failure(ClientErrorKind::Parse, error);
    }
    return ClientResult<ResourceUsage>::ok(usage);
}

ClientResult<QVector<InstanceMessage>> RestInstanceClient::getMessages(const SessionHandle& session) {
    const ClientResult<QByteArray> body = get(session, "/services/messages");
    if (!body.success()) {
        return ClientResult<QVector<InstanceMessage>>::failure(body.error, body.message);
    }
    return rest::parseMessages(*body.value);
}

}  // namespace sscope
