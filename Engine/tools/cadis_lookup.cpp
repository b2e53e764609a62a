/**
 * @file cadis_lookup.cpp
 * @brief CLI tool to resolve coordinates against a dataset directory
 *
 * Usage: cadis_lookup [dataset_dir] <lat> <lon> [<lat> <lon> ...]
 *
 * The dataset directory defaults to CADIS_DATASET_DIR. Each result is printed
 * as one JSON document in the serving layer's response shape.
 */

#include <core/errors.hpp>
#include <lookup/lookup_engine.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <vector>

using namespace Cadis;
namespace fs = std::filesystem;
using json = nlohmann::json;

static json to_response(const HierarchyResult& result) {
    json hierarchy = json::array();
    for (const auto& node : result.nodes) {
        hierarchy.push_back({
            {"level", node.level},
            {"name", node.name},
            {"osm_id", node.id},
            {"rank", node.rank},
            {"source", node.source}
        });
    }
    return {
        {"engine", result.engine},
        {"lookup_status", to_string(result.status)},
        {"summary_text", result.summary_text},
        {"iso_context", {{"iso2", result.iso_context.iso2}, {"name", result.iso_context.name}}},
        {"result", {{"admin_hierarchy", hierarchy}}},
        {"version", result.version}
    };
}

static bool parse_double(const char* text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == std::string(text).size();
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv) {
    EngineConfig config = EngineConfig::from_env();
    config.apply_logging();

    std::vector<const char*> args(argv + 1, argv + argc);
    if (args.size() % 2 == 1) {
        config.dataset_dir = args.front();
        args.erase(args.begin());
    }

    if (args.empty() || config.dataset_dir.empty()) {
        std::cerr << "Usage: " << argv[0] << " [dataset_dir] <lat> <lon> [<lat> <lon> ...]\n"
                  << "       dataset_dir defaults to CADIS_DATASET_DIR\n";
        return 1;
    }

    fs::path dataset_dir(config.dataset_dir);
    if (!fs::is_directory(dataset_dir)) {
        std::cerr << "Error: '" << dataset_dir.string() << "' is not a valid directory\n";
        return 1;
    }

    try {
        LookupEngine engine(config);

        Timer timer;
        engine.load(dataset_dir);
        std::cerr << "Loaded in " << std::fixed << std::setprecision(2) << timer.elapsed_sec() << "s\n";

        int exit_code = 0;
        for (size_t i = 0; i + 1 < args.size(); i += 2) {
            double lat = 0.0, lon = 0.0;
            if (!parse_double(args[i], lat) || !parse_double(args[i + 1], lon)) {
                std::cerr << "Error: '" << args[i] << " " << args[i + 1] << "' is not a coordinate pair\n";
                exit_code = 1;
                continue;
            }
            try {
                std::cout << to_response(engine.lookup(lat, lon)).dump(2) << "\n";
            } catch (const InvalidCoordinateError& e) {
                std::cerr << "Error: " << e.what() << "\n";
                exit_code = 1;
            }
        }
        return exit_code;
    } catch (const CadisError& e) {
        std::cerr << "Error [" << static_cast<int>(e.code()) << "]: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
