#include "sscope/topology_builder.hpp"

#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QPair>

#include <algorithm>

#include "sscope/command_runner.hpp"
#include "sscope/telemetry.hpp"

namespace sscope {

namespace {

using EdgeKey = QPair<InstanceKey, InstanceKey>;

EdgeKey canonicalPair(const InstanceKey& a, const InstanceKey& b) {
    return b < a ? EdgeKey(b, a) : EdgeKey(a, b);
}

QString dotEscape(QString text) {
    text.replace("\\", "\\\\");
    text.replace("\"", "\\\"");
    return text;
}

QString dotId(const InstanceKey& key) {
    return QString("\"%1\"").arg(dotEscape(key.toString()));
}

QJsonArray toJsonArray(const QStringList& values) {
    QJsonArray out;
    for (const QString& value : values) {
        out.append(value);
    }
    return out;
}

}  // namespace

QString TopologyNode::stateName() const {
    return polled ? pollOutcomeName(outcome) : QString("unvisited");
}

QJsonObject TopologyNode::toJson() const {
    return {
        {"id", key.toString()},
        {"address", key.address},
        {"port", key.port},
        {"label", label},
        {"layer", roleLayerId(layer)},
        {"state", stateName()},
        {"roles", toJsonArray(roles)},
        {"error", errorDetail},
    };
}

QJsonObject TopologyEdge::toJson() const {
    return {
        {"from", from.toString()},
        {"to", to.toString()},
        {"relation", primaryRelation()},
        {"relations", toJsonArray(relations)},
    };
}

int TopologyGraph::nodeIndex(const InstanceKey& key) const {
    for (int i = 0; i < nodes.size(); ++i) {
        if (nodes.at(i).key == key) {
            return i;
        }
    }
    return -1;
}

const TopologyNode* TopologyGraph::node(const InstanceKey& key) const {
    const int index = nodeIndex(key);
    return index >= 0 ? &nodes.at(index) : nullptr;
}

const TopologyEdge* TopologyGraph::edgeBetween(const InstanceKey& a, const InstanceKey& b) const {
    for (const TopologyEdge& edge : edges) {
        if ((edge.from == a && edge.to == b) || (edge.from == b && edge.to == a)) {
            return &edge;
        }
    }
    return nullptr;
}

QJsonObject TopologyGraph::toJson(const TopologyStyle& style) const {
    QJsonArray nodeArray;
    for (const TopologyNode& item : nodes) {
        nodeArray.append(item.toJson());
    }
    QJsonArray edgeArray;
    for (const TopologyEdge& item : edges) {
        edgeArray.append(item.toJson());
    }
    QJsonArray layerArray;
    for (auto it = layers.constBegin(); it != layers.constEnd(); ++it) {
        QJsonArray members;
        for (int index : it.value()) {
            members.append(nodes.at(index).key.toString());
        }
        layerArray.append(QJsonObject{
            {"id", roleLayerId(it.key())},
            {"rank", static_cast<int>(it.key())},
            {"label", style.labelFor(it.key())},
            {"color", style.colorFor(it.key())},
            {"nodes", members},
        });
    }
    return {
        {"nodes", nodeArray},
        {"edges", edgeArray},
        {"layers", layerArray},
    };
}

TopologyBuilder::TopologyBuilder(const RoleClassifier& classifier)
    : classifier_(classifier) {}

TopologyGraph TopologyBuilder::build(const DiscoveryResult& result) const {
    TopologyGraph graph;
    QHash<InstanceKey, int> index;

    for (const InstanceReport& report : result.reports) {
        if (index.contains(report.key)) {
            continue;
        }
        TopologyNode node;
        node.key = report.key;
        node.layer = classifier_.classify(report.roles);
        node.polled = true;
        node.outcome = report.outcome;
        node.label = report.displayName();
        node.roles = report.roles;
        node.errorDetail = report.errorDetail;
        index.insert(node.key, graph.nodes.size());
        graph.nodes.append(node);
    }

    const auto ensurePlaceholder = [&](const InstanceKey& key) {
        if (index.contains(key)) {
            return;
        }
        TopologyNode node;
        node.key = key;
        node.layer = classifier_.classify(QSet<QString>{});
        node.label = key.toString();
        index.insert(key, graph.nodes.size());
        graph.nodes.append(node);
    };
    for (const DiscoveredNode& placeholder : result.discovered) {
        ensurePlaceholder(placeholder.key);
    }

    QHash<EdgeKey, int> edgeIndex;
    for (const InstanceReport& report : result.reports) {
        for (const Adjacency& adjacency : report.adjacencies) {
            ensurePlaceholder(adjacency.target);
            const EdgeKey pair = canonicalPair(report.key, adjacency.target);
            const auto existing = edgeIndex.constFind(pair);
            if (existing != edgeIndex.constEnd()) {
                TopologyEdge& edge = graph.edges[existing.value()];
                if (!edge.relations.contains(adjacency.relation)) {
                    edge.relations.append(adjacency.relation);
                }
                continue;
            }
            edgeIndex.insert(pair, graph.edges.size());
            graph.edges.append(TopologyEdge{report.key, adjacency.target, {adjacency.relation}});
        }
    }

    for (int i = 0; i < graph.nodes.size(); ++i) {
        graph.layers[graph.nodes.at(i).layer].append(i);
    }
    for (auto it = graph.layers.begin(); it != graph.layers.end(); ++it) {
        std::sort(it.value().begin(), it.value().end(), [&graph](int lhs, int rhs) {
            return graph.nodes.at(lhs).key.toString() < graph.nodes.at(rhs).key.toString();
        });
    }
    return graph;
}

QString TopologyBuilder::toDot(const TopologyGraph& graph, const TopologyStyle& style) {
    QString dot;
    dot += "digraph SplunkTopology {\n";
    dot += QString("  rankdir=%1;\n").arg(style.rankDirection);
    dot += "  newrank=true;\n";
    dot += "  node [shape=box, style=\"rounded,filled\", fontname=\"Helvetica\"];\n";
    dot += "  edge [dir=none, fontsize=9];\n\n";

    for (auto it = graph.layers.constBegin(); it != graph.layers.constEnd(); ++it) {
        const RoleLayer layer = it.key();
        dot += QString("  subgraph \"layer_%1\" {\n").arg(roleLayerId(layer));
        dot += "    rank=same;\n";
        dot += QString("    \"label_%1\" [shape=plaintext, style=\"\", label=\"%2\"];\n")
                   .arg(roleLayerId(layer), dotEscape(style.labelFor(layer)));
        for (int index : it.value()) {
            const TopologyNode& node = graph.nodes.at(index);
            QString label = dotEscape(node.label);
            if (node.label != node.key.toString()) {
                label += "\\n" + dotEscape(node.key.toString());
            }
            QStringList attributes = {
                QString("label=\"%1\"").arg(label),
                QString("fillcolor=\"%1\"").arg(style.colorFor(layer)),
            };
            if (!node.polled) {
                attributes = {
                    QString("label=\"%1\\n(unvisited)\"").arg(label),
                    QString("fillcolor=\"%1\"").arg(style.discoveredColor),
                    "style=\"rounded,dashed,filled\"",
                };
            } else if (node.outcome == PollOutcome::Failed) {
                attributes << QString("color=\"%1\"").arg(style.failedColor) << "penwidth=3";
            } else if (node.outcome == PollOutcome::Partial) {
                attributes << QString("color=\"%1\"").arg(style.partialColor) << "penwidth=2";
            }
            if (!node.errorDetail.isEmpty()) {
                attributes << QString("tooltip=\"%1\"").arg(dotEscape(node.errorDetail));
            }
            dot += QString("    %1 [%2];\n").arg(dotId(node.key), attributes.join(", "));
        }
        dot += "  }\n";
    }

    // Invisible chain keeps layer labels in rank order.
    QStringList labelChain;
    for (auto it = graph.layers.constBegin(); it != graph.layers.constEnd(); ++it) {
        labelChain.append(QString("\"label_%1\"").arg(roleLayerId(it.key())));
    }
    if (labelChain.size() > 1) {
        dot += QString("\n  %1 [style=invis];\n").arg(labelChain.join(" -> "));
    }

    dot += "\n";
    for (const TopologyEdge& edge : graph.edges) {
        QStringList relationLabels;
        for (const QString& relation : edge.relations) {
            relationLabels.append(dotEscape(relation));
        }
        dot += QString("  %1 -> %2 [label=\"%3\"];\n")
                   .arg(dotId(edge.from), dotId(edge.to), relationLabels.join("\\n"));
    }
    dot += "}\n";
    return dot;
}

QJsonObject TopologyBuilder::exportImage(
    const TopologyGraph& graph,
    const TopologyStyle& style,
    const QString& filePath,
    const QString& format,
    const QString& dotProgram,
    int timeoutMs) {
    const QString normalized = format.trimmed().toLower();
    static const QStringList supported = {"png", "svg", "pdf"};
    if (!supported.contains(normalized)) {
        return {
            {"success", false},
            {"error", QString("Unsupported image format '%1'.").arg(format)},
            {"path", filePath},
        };
    }

    QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }

    const CommandResult result = CommandRunner::run(
        dotProgram,
        {QString("-T%1").arg(normalized), "-o", filePath},
        timeoutMs,
        toDot(graph, style).toUtf8());
    if (!result.success()) {
        Telemetry::instance().incrementCounter("topology.render_failures");
        return {
            {"success", false},
            {"error", result.stderrText.trimmed().isEmpty() ? QString("dot exited with %1").arg(result.exitCode)
                                                            : result.stderrText.trimmed()},
            {"path", filePath},
        };
    }
    Telemetry::instance().recordEvent(
        "topology_exported",
        {
            {"path", filePath},
            {"format", normalized},
            {"nodes", graph.nodes.size()},
            {"edges", graph.edges.size()},
        });
    return {
        {"success", true},
        {"path", filePath},
        {"format", normalized},
    };
}

}  // namespace sscope
