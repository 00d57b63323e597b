// Model graph exporter: package listing and JSON graph export (C++20)

#include <graph_builder/graph_builder.hpp>
#include <graph_builder/package_enumerator.hpp>
#include <graph_export/graph_json.hpp>
#include <model_loaders/sample_model.hpp>
#include <model_loaders/snapshot_loader.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

enum ExitCode {
    exit_ok = 0,
    exit_usage = 1,
    exit_connection_failed = 2,
    exit_no_packages = 3,
    exit_package_not_found = 4,
    exit_write_failed = 5,
};

struct Options {
    std::string model_path;
    bool use_sample = false;
    bool list_packages = false;
    std::string package_name;
    std::optional<int> package_id;
    std::string output_dir = ".";
    bool to_stdout = false;
    std::string log_file;
    bool help = false;
};

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "Usage: %s (--model PATH | --sample) [--list] [--package NAME | --package-id ID]\n"
        "          [--output DIR] [--stdout] [--log-file PATH]\n"
        "\n"
        "  --model PATH       model snapshot (JSON) to read\n"
        "  --sample           use the built-in sample model\n"
        "  --list             print the selectable packages and exit\n"
        "  --package NAME     root package to export, by name\n"
        "  --package-id ID    root package to export, by id\n"
        "  --output DIR       directory for %s (default: .)\n"
        "  --stdout           print the graph instead of writing the file\n"
        "  --log-file PATH    log file (default: logs/model_graph_export_latest.log)\n",
        argv0, graph_export::default_file_name);
}

bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "Missing value for %s\n", arg.c_str());
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--model") {
            if (!next_value(opts.model_path)) return false;
        } else if (arg == "--sample") {
            opts.use_sample = true;
        } else if (arg == "--list") {
            opts.list_packages = true;
        } else if (arg == "--package") {
            if (!next_value(opts.package_name)) return false;
        } else if (arg == "--package-id") {
            std::string value;
            if (!next_value(value)) return false;
            char* end = nullptr;
            const long id = std::strtol(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0') {
                (void)fprintf(stderr, "Invalid package id: %s\n", value.c_str());
                return false;
            }
            opts.package_id = static_cast<int>(id);
        } else if (arg == "--output") {
            if (!next_value(opts.output_dir)) return false;
        } else if (arg == "--stdout") {
            opts.to_stdout = true;
        } else if (arg == "--log-file") {
            if (!next_value(opts.log_file)) return false;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            (void)fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            return false;
        }
    }
    if (opts.help) return true;
    if (opts.model_path.empty() == !opts.use_sample) {
        (void)fprintf(stderr, "Exactly one of --model or --sample is required\n");
        return false;
    }
    if (!opts.list_packages && opts.package_name.empty() && !opts.package_id) {
        (void)fprintf(stderr, "Nothing to do: pass --list, --package or --package-id\n");
        return false;
    }
    return true;
}

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> make_app_logger(const std::string& log_file_option) {
    try {
        std::filesystem::path log_file = log_file_option;
        if (log_file.empty())
            log_file = find_project_root() / "logs" / "model_graph_export_latest.log";
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        auto logger = spdlog::basic_logger_mt("model_graph_export", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        spdlog::set_default_logger(logger);
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        return spdlog::default_logger();
    }
}

// Re-reads the selection from the repository: a package removed since listing is not found.
std::optional<model_source::SourcePackage> select_package(const model_source::ModelRepository& repository,
    const std::vector<model_source::SourcePackage>& selectable, const Options& opts)
{
    int package_id = 0;
    if (opts.package_id) {
        package_id = *opts.package_id;
    } else {
        auto by_name = graph_builder::find_package_by_name(selectable, opts.package_name);
        if (!by_name) return std::nullopt;
        package_id = by_name->id;
    }
    return repository.package_by_id(package_id);
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return exit_usage;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return exit_ok;
    }

    auto log = make_app_logger(opts.log_file);

    std::optional<model_source::MemoryRepository> repository;
    if (opts.use_sample) {
        repository = model_loaders::generate_sample_repository();
        log->info("Using built-in sample model");
    } else {
        repository = model_loaders::load_repository_from_json_file(opts.model_path);
        if (!repository) {
            (void)fprintf(stderr, "Could not open model '%s'. Check that the snapshot exists and is valid JSON.\n",
                opts.model_path.c_str());
            log->error("Model session failed: {}", opts.model_path);
            return exit_connection_failed;
        }
        log->info("Model session opened: {} packages={} diagrams={} elements={} connectors={}",
            opts.model_path, repository->package_count(), repository->diagram_count(),
            repository->element_count(), repository->connector_count());
    }

    const auto selectable = graph_builder::selectable_packages(graph_builder::collect_packages(*repository));
    if (selectable.empty()) {
        (void)fprintf(stderr, "No valid packages found in the model.\n");
        log->error("No selectable packages");
        return exit_no_packages;
    }

    if (opts.list_packages) {
        for (const auto& p : selectable)
            (void)printf("%d\t%s\n", p.id, p.name.c_str());
        return exit_ok;
    }

    auto root = select_package(*repository, selectable, opts);
    if (!root) {
        const std::string wanted = opts.package_id ? std::to_string(*opts.package_id) : opts.package_name;
        (void)fprintf(stderr, "Selected package could not be found: %s\n", wanted.c_str());
        log->error("Selected package not found: {}", wanted);
        return exit_package_not_found;
    }
    log->info("Generating graph for package '{}' (id={})", root->name, root->id);

    const model_graph::Graph graph = graph_builder::build_graph(*repository, *root);
    log->info("Graph created: nodes={} edges={}", graph.nodes.size(), graph.edges.size());

    const graph_export::DownloadArtifact artifact = graph_export::make_download_artifact(graph);
    if (opts.to_stdout) {
        (void)printf("%s\n", artifact.content.c_str());
        return exit_ok;
    }
    if (!graph_export::write_artifact(artifact, opts.output_dir)) {
        (void)fprintf(stderr, "Could not write %s to %s\n", artifact.file_name.c_str(), opts.output_dir.c_str());
        log->error("Artifact write failed: dir={} file={}", opts.output_dir, artifact.file_name);
        return exit_write_failed;
    }
    const std::filesystem::path written = std::filesystem::path(opts.output_dir) / artifact.file_name;
    (void)fprintf(stderr, "JSON graph created: %s (%s, %zu bytes)\n",
        written.string().c_str(), artifact.mime_type.c_str(), artifact.content.size());
    log->info("Artifact written: {} ({})", written.string(), artifact.mime_type);
    return exit_ok;
}
