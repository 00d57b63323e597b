#pragma once

#include <model_source/memory_repository.hpp>
#include <optional>
#include <istream>
#include <string>

namespace model_loaders {

std::optional<model_source::MemoryRepository> load_repository_from_json(std::istream& in);
std::optional<model_source::MemoryRepository> load_repository_from_json_file(const std::string& path);

} // namespace model_loaders
