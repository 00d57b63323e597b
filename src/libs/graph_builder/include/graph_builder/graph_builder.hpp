#pragma once

#include <model_graph/graph.hpp>
#include <model_source/repository.hpp>
#include <model_source/types.hpp>

namespace graph_builder {

// Builds the node/edge graph reachable from the root package's main (first)
// diagram: diagram placements, their linked diagrams, classifiers and connectors.
// Every element, diagram and (from, to, type) edge is emitted at most once.
// Unresolvable ids are skipped. The repository must not change during the call.
model_graph::Graph build_graph(const model_source::ModelRepository& repository,
    const model_source::SourcePackage& root_package);

} // namespace graph_builder
