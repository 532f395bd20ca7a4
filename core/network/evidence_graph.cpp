#include "network/evidence_graph.hpp"
#include <unordered_set>

namespace hegel {

// ─── Node operations ───────────────────────────────────────────

EvidenceNode& EvidenceGraph::insertNode(const std::string& id,
                                        const std::string& evidence_type) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        order_.push_back(id);
        it = nodes_.emplace(id, EvidenceNode(id, evidence_type)).first;
    } else {
        it->second = EvidenceNode(id, evidence_type);
    }
    incident_[id];  // ensure entry exists
    return it->second;
}

void EvidenceGraph::addEvidence(FuzzyEvidence evidence) {
    std::string id = evidence.id;
    std::string type = evidence.evidence_type;
    EvidenceNode& node = insertNode(id, type);
    node.fuzzy_evidence = std::move(evidence);
}

void EvidenceGraph::addPlaceholder(const std::string& id, const std::string& evidence_type) {
    insertNode(id, evidence_type);
}

EvidenceNode* EvidenceGraph::getNode(const std::string& id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const EvidenceNode* EvidenceGraph::getNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

// ─── Edge operations ───────────────────────────────────────────

void EvidenceGraph::addEdge(EvidenceEdge edge) {
    size_t index = edges_.size();
    incident_[edge.from].push_back(index);
    if (edge.to != edge.from) {
        incident_[edge.to].push_back(index);
    }
    edges_.push_back(std::move(edge));
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<const EvidenceEdge*> EvidenceGraph::incidentEdges(const std::string& id) const {
    std::vector<const EvidenceEdge*> result;
    auto it = incident_.find(id);
    if (it == incident_.end()) return result;
    result.reserve(it->second.size());
    for (size_t index : it->second) {
        result.push_back(&edges_[index]);
    }
    return result;
}

std::vector<std::string> EvidenceGraph::neighbors(const std::string& id) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const EvidenceEdge* e : incidentEdges(id)) {
        const std::string& other = e->from == id ? e->to : e->from;
        if (other == id || !hasNode(other)) continue;
        if (seen.insert(other).second) {
            result.push_back(other);
        }
    }
    return result;
}

// ─── Iteration ─────────────────────────────────────────────────

void EvidenceGraph::forEachNode(const std::function<void(const EvidenceNode&)>& fn) const {
    for (const auto& id : order_) {
        fn(nodes_.at(id));
    }
}

void EvidenceGraph::updateEachNode(const std::function<void(EvidenceNode&)>& fn) {
    for (const auto& id : order_) {
        fn(nodes_.at(id));
    }
}

void EvidenceGraph::forEachEdge(const std::function<void(const EvidenceEdge&)>& fn) const {
    for (const auto& edge : edges_) {
        fn(edge);
    }
}

void EvidenceGraph::clear() {
    nodes_.clear();
    order_.clear();
    edges_.clear();
    incident_.clear();
}

} // namespace hegel
