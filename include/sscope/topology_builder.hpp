#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include "sscope/discovery_orchestrator.hpp"
#include "sscope/instance_key.hpp"
#include "sscope/instance_report.hpp"
#include "sscope/role_classifier.hpp"
#include "sscope/tool_config.hpp"

namespace sscope {

struct TopologyNode {
    InstanceKey key;
    RoleLayer layer = RoleLayer::DiscoveredNode;
    // False for placeholders, which carry no poll data.
    bool polled = false;
    PollOutcome outcome = PollOutcome::Failed;
    QString label;
    QStringList roles;
    QString errorDetail;

    [[nodiscard]] QString stateName() const;
    [[nodiscard]] QJsonObject toJson() const;
};

// Undirected: one edge per key pair. `from` is the reporting side of the first
// sighting; relations[0] is the primary label.
struct TopologyEdge {
    InstanceKey from;
    InstanceKey to;
    QStringList relations;

    [[nodiscard]] QString primaryRelation() const { return relations.isEmpty() ? QString() : relations.first(); }
    [[nodiscard]] QJsonObject toJson() const;
};

struct TopologyGraph {
    QVector<TopologyNode> nodes;
    QVector<TopologyEdge> edges;
    // Node indices per layer, ordered by address:port.
    QMap<RoleLayer, QVector<int>> layers;

    [[nodiscard]] int nodeIndex(const InstanceKey& key) const;
    [[nodiscard]] const TopologyNode* node(const InstanceKey& key) const;
    [[nodiscard]] const TopologyEdge* edgeBetween(const InstanceKey& a, const InstanceKey& b) const;
    [[nodiscard]] QJsonObject toJson(const TopologyStyle& style) const;
};

// Turns a discovery result into a layered graph. Layout coordinates are left
// to the renderer.
class TopologyBuilder {
public:
    explicit TopologyBuilder(const RoleClassifier& classifier);

    [[nodiscard]] TopologyGraph build(const DiscoveryResult& result) const;

    static QString toDot(const TopologyGraph& graph, const TopologyStyle& style);
    // Renders through Graphviz. format is one of png, svg, pdf.
    static QJsonObject exportImage(
        const TopologyGraph& graph,
        const TopologyStyle& style,
        const QString& filePath,
        const QString& format,
        const QString& dotProgram = "dot",
        int timeoutMs = 20000);

private:
    const RoleClassifier& classifier_;
};

}  // namespace sscope
