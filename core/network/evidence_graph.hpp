#pragma once

#include "network/node.hpp"
#include "network/edge.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hegel {

// ─── Evidence Graph ────────────────────────────────────────────
// Nodes keyed by evidence id, edges in insertion order. Nodes also keep
// insertion order so every pass over the graph is deterministic.
// Scoped to one fusion call: there is no removal.

class EvidenceGraph {
public:
    EvidenceGraph() = default;

    // ── Node operations ──

    /// Insert a node for the evidence, or overwrite the node with that id.
    /// Belief state starts neutral: prior = posterior = 0.5, no influence.
    void addEvidence(FuzzyEvidence evidence);

    /// Insert a node for expected evidence that carries no data yet.
    void addPlaceholder(const std::string& id, const std::string& evidence_type);

    EvidenceNode* getNode(const std::string& id);
    const EvidenceNode* getNode(const std::string& id) const;
    bool hasNode(const std::string& id) const { return nodes_.count(id) > 0; }
    const std::vector<std::string>& nodeIds() const { return order_; }
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──

    /// Edges are stored even when an endpoint is missing; readers skip them.
    void addEdge(EvidenceEdge edge);
    const std::vector<EvidenceEdge>& edges() const { return edges_; }
    size_t edgeCount() const { return edges_.size(); }

    /// True when both endpoints exist as nodes.
    bool isResolved(const EvidenceEdge& edge) const {
        return hasNode(edge.from) && hasNode(edge.to);
    }

    // ── Adjacency queries ──

    /// Edges touching the node in either direction.
    std::vector<const EvidenceEdge*> incidentEdges(const std::string& id) const;

    /// Existing nodes linked to id in either direction, unique, in
    /// first-seen edge order.
    std::vector<std::string> neighbors(const std::string& id) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(const EvidenceNode&)>& fn) const;
    void updateEachNode(const std::function<void(EvidenceNode&)>& fn);
    void forEachEdge(const std::function<void(const EvidenceEdge&)>& fn) const;

    EvidenceGraph clone() const { return *this; }
    void clear();

private:
    std::unordered_map<std::string, EvidenceNode> nodes_;
    std::vector<std::string> order_;
    std::vector<EvidenceEdge> edges_;

    // node id → indices into edges_, both directions
    std::unordered_map<std::string, std::vector<size_t>> incident_;

    EvidenceNode& insertNode(const std::string& id, const std::string& evidence_type);
};

} // namespace hegel
