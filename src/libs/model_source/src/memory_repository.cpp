#include <model_source/memory_repository.hpp>
#include <algorithm>
#include <utility>

namespace model_source {

namespace {

template <typename Value>
void unlink(std::unordered_map<int, std::vector<Value>>& buckets, int key, Value value) {
    auto it = buckets.find(key);
    if (it == buckets.end()) return;
    auto& v = it->second;
    v.erase(std::remove(v.begin(), v.end(), value), v.end());
}

// Diagrams hang off their parent element, or off their package when they have none.
std::unordered_map<int, std::vector<int>>& diagram_bucket(const SourceDiagram& d,
    std::unordered_map<int, std::vector<int>>& package_diagrams,
    std::unordered_map<int, std::vector<int>>& element_diagrams)
{
    return d.parent_element_id == 0 ? package_diagrams : element_diagrams;
}

int diagram_owner(const SourceDiagram& d) {
    return d.parent_element_id == 0 ? d.package_id : d.parent_element_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

void MemoryRepository::add_package(SourcePackage package) {
    // Child lists are computed on lookup.
    package.package_ids.clear();
    package.diagram_ids.clear();

    auto it = package_index_.find(package.id);
    if (it != package_index_.end()) {
        SourcePackage& existing = packages_[it->second];
        if (existing.parent_id != package.parent_id) {
            unlink(package_children_, existing.parent_id, existing.id);
            if (package.parent_id != package.id) package_children_[package.parent_id].push_back(package.id);
        }
        existing = std::move(package);
        return;
    }
    if (package.parent_id != package.id) package_children_[package.parent_id].push_back(package.id);
    package_index_[package.id] = packages_.size();
    packages_.push_back(std::move(package));
}

void MemoryRepository::add_diagram(SourceDiagram diagram) {
    auto it = diagram_index_.find(diagram.id);
    if (it != diagram_index_.end()) {
        SourceDiagram& existing = diagrams_[it->second];
        const bool moved = (existing.parent_element_id == 0) != (diagram.parent_element_id == 0)
            || diagram_owner(existing) != diagram_owner(diagram);
        if (moved) {
            unlink(diagram_bucket(existing, package_diagrams_, element_diagrams_), diagram_owner(existing), existing.id);
            diagram_bucket(diagram, package_diagrams_, element_diagrams_)[diagram_owner(diagram)].push_back(diagram.id);
        }
        existing = std::move(diagram);
        return;
    }
    diagram_bucket(diagram, package_diagrams_, element_diagrams_)[diagram_owner(diagram)].push_back(diagram.id);
    diagram_index_[diagram.id] = diagrams_.size();
    diagrams_.push_back(std::move(diagram));
}

void MemoryRepository::add_element(SourceElement element) {
    element.connectors.clear();
    element.diagram_ids.clear();

    auto it = element_index_.find(element.id);
    if (it != element_index_.end()) {
        elements_[it->second] = std::move(element);
        return;
    }
    element_index_[element.id] = elements_.size();
    elements_.push_back(std::move(element));
}

void MemoryRepository::add_connector(SourceConnector connector) {
    auto it = connector_index_.find(connector.id);
    if (it != connector_index_.end()) {
        const std::size_t pos = it->second;
        SourceConnector& existing = connectors_[pos];
        if (existing.client_id != connector.client_id || existing.supplier_id != connector.supplier_id) {
            unlink(element_connectors_, existing.client_id, pos);
            unlink(element_connectors_, existing.supplier_id, pos);
            element_connectors_[connector.client_id].push_back(pos);
            if (connector.supplier_id != connector.client_id)
                element_connectors_[connector.supplier_id].push_back(pos);
        }
        existing = std::move(connector);
        return;
    }
    const std::size_t pos = connectors_.size();
    element_connectors_[connector.client_id].push_back(pos);
    if (connector.supplier_id != connector.client_id)
        element_connectors_[connector.supplier_id].push_back(pos);
    connector_index_[connector.id] = pos;
    connectors_.push_back(std::move(connector));
}

std::vector<int> MemoryRepository::model_ids() const {
    auto it = package_children_.find(0);
    if (it == package_children_.end()) return {};
    return it->second;
}

std::optional<SourcePackage> MemoryRepository::package_by_id(int package_id) const {
    auto it = package_index_.find(package_id);
    if (it == package_index_.end()) return std::nullopt;

    SourcePackage out = packages_[it->second];
    if (auto children = package_children_.find(package_id); children != package_children_.end())
        out.package_ids = children->second;
    if (auto diagrams = package_diagrams_.find(package_id); diagrams != package_diagrams_.end())
        out.diagram_ids = diagrams->second;
    return out;
}

std::optional<SourceElement> MemoryRepository::element_by_id(int element_id) const {
    auto it = element_index_.find(element_id);
    if (it == element_index_.end()) return std::nullopt;

    SourceElement out = elements_[it->second];
    if (auto connectors = element_connectors_.find(element_id); connectors != element_connectors_.end()) {
        out.connectors.reserve(connectors->second.size());
        for (std::size_t pos : connectors->second) out.connectors.push_back(connectors_[pos]);
    }
    if (auto diagrams = element_diagrams_.find(element_id); diagrams != element_diagrams_.end())
        out.diagram_ids = diagrams->second;
    return out;
}

std::optional<SourceDiagram> MemoryRepository::diagram_by_id(int diagram_id) const {
    auto it = diagram_index_.find(diagram_id);
    if (it == diagram_index_.end()) return std::nullopt;
    return diagrams_[it->second];
}

bool MemoryRepository::has_element(int element_id) const {
    return element_index_.count(element_id) != 0;
}

} // namespace model_source
