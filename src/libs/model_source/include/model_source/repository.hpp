#pragma once

#include <model_source/types.hpp>
#include <optional>
#include <vector>

namespace model_source {

// Read-only view of a hierarchical model. Lookups never throw: an id that does
// not resolve yields std::nullopt and callers treat that as "skip".
class ModelRepository {
public:
    virtual ~ModelRepository() = default;

    // Top-level package ids (the host's model roots), in host order.
    virtual std::vector<int> model_ids() const = 0;

    virtual std::optional<SourcePackage> package_by_id(int package_id) const = 0;
    virtual std::optional<SourceElement> element_by_id(int element_id) const = 0;
    virtual std::optional<SourceDiagram> diagram_by_id(int diagram_id) const = 0;

    // Resolution check without building the element record.
    virtual bool has_element(int element_id) const { return element_by_id(element_id).has_value(); }
};

} // namespace model_source
