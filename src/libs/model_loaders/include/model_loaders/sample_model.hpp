#pragma once

#include <model_source/memory_repository.hpp>

namespace model_loaders {

// Small built-in model covering nested packages, a linked child diagram, a
// classifier reference, connectors seen from both ends and a dangling placement.
model_source::MemoryRepository generate_sample_repository();

} // namespace model_loaders
