#pragma once

#include <model_source/repository.hpp>
#include <model_source/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace graph_builder {

// Every package reachable from the model roots, depth-first pre-order (each root
// followed by its subtree).
std::vector<model_source::SourcePackage> collect_packages(const model_source::ModelRepository& repository);

// Packages offered for selection: model roots removed, sorted by name (stable).
std::vector<model_source::SourcePackage> selectable_packages(std::vector<model_source::SourcePackage> packages);

// Last package with the given name, matching a name-keyed lookup built from the list.
std::optional<model_source::SourcePackage> find_package_by_name(
    const std::vector<model_source::SourcePackage>& packages, const std::string& name);

} // namespace graph_builder
