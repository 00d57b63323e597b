#include <model_loaders/snapshot_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <limits>

namespace model_loaders {

namespace {

std::string string_or_empty(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

// JSON integer that fits in an int. Floats, fractions and out-of-range values yield nullopt.
std::optional<int> int_value(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        const auto i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(i);
    }
    return std::nullopt;
}

// Absent or null leaves `out` untouched; any other non-int value is malformed.
bool read_int(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    auto v = int_value(j[key]);
    if (!v) return false;
    out = *v;
    return true;
}

bool read_position(const nlohmann::json& j, const char* key, std::optional<int>& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    out = int_value(j[key]);
    return out.has_value();
}

bool read_id(const nlohmann::json& j, int& out) {
    return j.is_object() && j.contains("id") && !j["id"].is_null() && read_int(j, "id", out);
}

bool array_or_absent(const nlohmann::json& j, const char* key) {
    return !j.contains(key) || j[key].is_array();
}

std::optional<model_source::SourceAttribute> parse_attribute(const nlohmann::json& a) {
    model_source::SourceAttribute attr;
    if (!read_id(a, attr.id)) return std::nullopt;
    attr.name = string_or_empty(a, "name");
    attr.type = string_or_empty(a, "type");
    // Host defaults are text; numbers and booleans are kept in their JSON spelling.
    if (a.contains("default") && !a["default"].is_null())
        attr.default_value = a["default"].is_string() ? a["default"].get<std::string>() : a["default"].dump();
    return attr;
}

std::optional<model_source::DiagramObject> parse_diagram_object(const nlohmann::json& o) {
    if (!o.is_object() || !o.contains("element_id")) return std::nullopt;
    model_source::DiagramObject obj;
    if (!read_int(o, "element_id", obj.element_id)) return std::nullopt;
    if (!read_position(o, "left", obj.left) || !read_position(o, "right", obj.right)
        || !read_position(o, "top", obj.top) || !read_position(o, "bottom", obj.bottom))
        return std::nullopt;
    return obj;
}

std::optional<model_source::MemoryRepository> parse_snapshot(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!array_or_absent(j, "packages") || !array_or_absent(j, "diagrams")
        || !array_or_absent(j, "elements") || !array_or_absent(j, "connectors"))
        return std::nullopt;

    model_source::MemoryRepository repo;

    if (j.contains("packages")) {
        for (const auto& p : j["packages"]) {
            model_source::SourcePackage pkg;
            if (!read_id(p, pkg.id) || !read_int(p, "parent_id", pkg.parent_id)) return std::nullopt;
            pkg.name = string_or_empty(p, "name");
            repo.add_package(std::move(pkg));
        }
    }

    if (j.contains("diagrams")) {
        for (const auto& d : j["diagrams"]) {
            model_source::SourceDiagram diagram;
            if (!read_id(d, diagram.id) || !array_or_absent(d, "objects")
                || !read_int(d, "package_id", diagram.package_id)
                || !read_int(d, "parent_element_id", diagram.parent_element_id))
                return std::nullopt;
            diagram.name = string_or_empty(d, "name");
            if (d.contains("objects")) {
                for (const auto& o : d["objects"]) {
                    auto obj = parse_diagram_object(o);
                    if (!obj) return std::nullopt;
                    diagram.objects.push_back(*obj);
                }
            }
            repo.add_diagram(std::move(diagram));
        }
    }

    if (j.contains("elements")) {
        for (const auto& e : j["elements"]) {
            model_source::SourceElement element;
            if (!read_id(e, element.id) || !array_or_absent(e, "attributes")
                || !read_int(e, "package_id", element.package_id)
                || !read_int(e, "classifier_id", element.classifier_id))
                return std::nullopt;
            element.name = string_or_empty(e, "name");
            element.type = string_or_empty(e, "type");
            if (e.contains("attributes")) {
                for (const auto& a : e["attributes"]) {
                    auto attr = parse_attribute(a);
                    if (!attr) return std::nullopt;
                    element.attributes.push_back(std::move(*attr));
                }
            }
            repo.add_element(std::move(element));
        }
    }

    if (j.contains("connectors")) {
        for (const auto& c : j["connectors"]) {
            model_source::SourceConnector connector;
            if (!read_id(c, connector.id) || !read_int(c, "client_id", connector.client_id)
                || !read_int(c, "supplier_id", connector.supplier_id))
                return std::nullopt;
            connector.type = string_or_empty(c, "type");
            connector.name = string_or_empty(c, "name");
            repo.add_connector(std::move(connector));
        }
    }

    return repo;
}

} // namespace

std::optional<model_source::MemoryRepository> load_repository_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        auto repo = parse_snapshot(j);
        if (!repo) spdlog::warn("Model snapshot rejected: unexpected document structure");
        return repo;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Model snapshot could not be parsed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<model_source::MemoryRepository> load_repository_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("Model snapshot not found: {}", path);
        return std::nullopt;
    }
    return load_repository_from_json(f);
}

} // namespace model_loaders
