#include <graph_builder/package_enumerator.hpp>
#include <algorithm>
#include <utility>

namespace graph_builder {

namespace {

void collect_recursive(const model_source::ModelRepository& repository, int package_id,
    std::vector<model_source::SourcePackage>& out)
{
    auto package = repository.package_by_id(package_id);
    if (!package) return;
    const std::vector<int> children = package->package_ids;
    out.push_back(std::move(*package));
    for (int child_id : children)
        collect_recursive(repository, child_id, out);
}

} // namespace

std::vector<model_source::SourcePackage> collect_packages(const model_source::ModelRepository& repository) {
    std::vector<model_source::SourcePackage> out;
    for (int model_id : repository.model_ids())
        collect_recursive(repository, model_id, out);
    return out;
}

std::vector<model_source::SourcePackage> selectable_packages(std::vector<model_source::SourcePackage> packages) {
    packages.erase(std::remove_if(packages.begin(), packages.end(),
                       [](const model_source::SourcePackage& p) { return p.parent_id == 0; }),
        packages.end());
    std::stable_sort(packages.begin(), packages.end(),
        [](const model_source::SourcePackage& a, const model_source::SourcePackage& b) { return a.name < b.name; });
    return packages;
}

std::optional<model_source::SourcePackage> find_package_by_name(
    const std::vector<model_source::SourcePackage>& packages, const std::string& name)
{
    for (auto it = packages.rbegin(); it != packages.rend(); ++it)
        if (it->name == name) return *it;
    return std::nullopt;
}

} // namespace graph_builder
