#pragma once

#include <model_source/repository.hpp>
#include <model_source/types.hpp>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace model_source {

// ModelRepository backed by plain records. Child lists (sub-packages, package and
// element diagrams, element connectors) are derived from the parent links of the
// records that were added, in insertion order, so they cannot go stale. A record
// replaced with a different parent moves to the end of its new parent's list.
class MemoryRepository : public ModelRepository {
public:
    MemoryRepository();

    // Adding a record with an id that already exists replaces it in place.
    void add_package(SourcePackage package);
    void add_diagram(SourceDiagram diagram);
    void add_element(SourceElement element);
    void add_connector(SourceConnector connector);

    std::size_t package_count() const { return packages_.size(); }
    std::size_t diagram_count() const { return diagrams_.size(); }
    std::size_t element_count() const { return elements_.size(); }
    std::size_t connector_count() const { return connectors_.size(); }

    std::vector<int> model_ids() const override;
    std::optional<SourcePackage> package_by_id(int package_id) const override;
    std::optional<SourceElement> element_by_id(int element_id) const override;
    std::optional<SourceDiagram> diagram_by_id(int diagram_id) const override;
    bool has_element(int element_id) const override;

private:
    std::vector<SourcePackage> packages_;
    std::vector<SourceDiagram> diagrams_;
    std::vector<SourceElement> elements_;
    std::vector<SourceConnector> connectors_;
    std::unordered_map<int, std::size_t> package_index_;
    std::unordered_map<int, std::size_t> diagram_index_;
    std::unordered_map<int, std::size_t> element_index_;
    std::unordered_map<int, std::size_t> connector_index_;

    // Parent id -> child ids (or connector positions), in insertion order.
    // Package parent 0 holds the model roots.
    std::unordered_map<int, std::vector<int>> package_children_;
    std::unordered_map<int, std::vector<int>> package_diagrams_;
    std::unordered_map<int, std::vector<int>> element_diagrams_;
    std::unordered_map<int, std::vector<std::size_t>> element_connectors_;
};

} // namespace model_source
