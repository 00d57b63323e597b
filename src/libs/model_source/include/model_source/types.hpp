#pragma once

#include <optional>
#include <string>
#include <vector>

namespace model_source {

struct SourceAttribute {
    int id = 0;
    std::string name;
    std::string type;
    std::string default_value;
};

// Directed relationship: client is the source end, supplier the target end.
struct SourceConnector {
    int id = 0;
    int client_id = 0;
    int supplier_id = 0;
    std::string type;
    std::string name;
};

// Placement of an element on a diagram. Geometry is whatever the host stores;
// any field may be missing.
struct DiagramObject {
    int element_id = 0;
    std::optional<int> left;
    std::optional<int> right;
    std::optional<int> top;
    std::optional<int> bottom;
};

struct SourceDiagram {
    int id = 0;
    int package_id = 0;
    // 0 = diagram sits directly in its package; otherwise it is a child diagram of that element.
    int parent_element_id = 0;
    std::string name;
    std::vector<DiagramObject> objects;
};

struct SourceElement {
    int id = 0;
    int package_id = 0;
    int classifier_id = 0;
    std::string name;
    std::string type;
    std::vector<SourceAttribute> attributes;
    std::vector<SourceConnector> connectors;
    std::vector<int> diagram_ids;
};

struct SourcePackage {
    int id = 0;
    int parent_id = 0;
    std::string name;
    std::vector<int> package_ids;
    std::vector<int> diagram_ids;
};

} // namespace model_source
