#include <dataset/geojson_reader.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>

namespace Cadis {

namespace fs = std::filesystem;
using json = nlohmann::json;
using Geometry::Vec2;

namespace {

struct ReadContext {
    std::string dir;
    std::string file;

    [[noreturn]] void fail(const std::string& what) const {
        throw DatasetLoadError(dir, file + ": " + what);
    }
};

Geometry::Ring parse_ring(const json& coords, const ReadContext& ctx) {
    if (!coords.is_array()) ctx.fail("ring must be an array of positions");

    Geometry::Ring ring;
    ring.reserve(coords.size());
    for (const auto& pos : coords) {
        if (!pos.is_array() || pos.size() < 2 || !pos[0].is_number() || !pos[1].is_number()) {
            ctx.fail("position must be [lon, lat]");
        }
        const double lon = pos[0].get<double>();
        const double lat = pos[1].get<double>();
        if (!std::isfinite(lon) || !std::isfinite(lat)) ctx.fail("position is not finite");
        ring.emplace_back(lon, lat);
    }
    // Drop the closing vertex; rings are treated as implicitly closed.
    if (ring.size() > 1 && ring.front() == ring.back()) ring.pop_back();
    if (ring.size() < 3) ctx.fail("ring needs at least 3 distinct vertices");
    return ring;
}

Geometry::Polygon parse_polygon(const json& rings, const ReadContext& ctx) {
    if (!rings.is_array() || rings.empty()) ctx.fail("polygon must have an outer ring");

    Geometry::Polygon poly;
    poly.outer = parse_ring(rings[0], ctx);
    for (size_t i = 1; i < rings.size(); ++i) {
        poly.holes.push_back(parse_ring(rings[i], ctx));
    }
    return poly;
}

Geometry::MultiPolygon parse_geometry(const json& geom, const ReadContext& ctx) {
    if (!geom.is_object()) ctx.fail("feature geometry must be an object");

    const std::string type = geom.value("type", "");
    auto coords = geom.find("coordinates");
    if (coords == geom.end()) ctx.fail("geometry has no coordinates");

    Geometry::MultiPolygon mp;
    if (type == "Polygon") {
        mp.push_back(parse_polygon(*coords, ctx));
    } else if (type == "MultiPolygon") {
        if (!coords->is_array() || coords->empty()) ctx.fail("MultiPolygon has no parts");
        for (const auto& part : *coords) mp.push_back(parse_polygon(part, ctx));
    } else {
        ctx.fail("unsupported geometry type '" + type + "'");
    }
    return mp;
}

} // namespace

std::vector<AdminFeature> GeoJsonReader::read_level(const fs::path& dataset_dir,
                                                    const std::string& relative_path,
                                                    int level) {
    ReadContext ctx{dataset_dir.string(), relative_path};

    std::ifstream file(dataset_dir / relative_path);
    if (!file) ctx.fail("cannot open geometry file");

    json raw;
    try {
        raw = json::parse(file);
    } catch (const json::parse_error& e) {
        ctx.fail(std::string("malformed JSON: ") + e.what());
    }

    if (!raw.is_object() || raw.value("type", "") != "FeatureCollection") {
        ctx.fail("expected a GeoJSON FeatureCollection");
    }
    auto features = raw.find("features");
    if (features == raw.end() || !features->is_array()) ctx.fail("FeatureCollection has no features list");

    std::vector<AdminFeature> out;
    out.reserve(features->size());

    for (size_t i = 0; i < features->size(); ++i) {
        const json& f = (*features)[i];
        const std::string where = "features[" + std::to_string(i) + "]";
        if (!f.is_object()) ctx.fail(where + " must be an object");

        auto props = f.find("properties");
        if (props == f.end() || !props->is_object()) ctx.fail(where + " has no properties");

        AdminFeature feature;
        feature.level = level;

        auto id = props->find("id");
        if (id == props->end() || !id->is_string() || id->get<std::string>().empty()) {
            ctx.fail(where + ".properties.id must be a non-empty string");
        }
        feature.id = id->get<std::string>();

        auto name = props->find("name");
        if (name == props->end() || !name->is_string()) {
            ctx.fail(where + " (" + feature.id + ") has no name");
        }
        feature.name = name->get<std::string>();

        auto declared = props->find("level");
        if (declared != props->end() && !declared->is_null()) {
            if (!declared->is_number_integer() || declared->get<int>() != level) {
                ctx.fail(where + " (" + feature.id + ") declares level " + declared->dump() +
                         " but is listed under level " + std::to_string(level));
            }
        }

        auto parent = props->find("parent_id");
        if (parent != props->end() && parent->is_string()) {
            feature.parent_id = parent->get<std::string>();
        }

        for (auto& [key, value] : props->items()) {
            if (key == "id" || key == "name" || key == "parent_id" || key == "level") continue;
            if (value.is_string()) feature.localized_names[key] = value.get<std::string>();
        }

        auto geom = f.find("geometry");
        if (geom == f.end()) ctx.fail(where + " (" + feature.id + ") has no geometry");
        feature.geometry = parse_geometry(*geom, ctx);

        out.push_back(std::move(feature));
    }
    return out;
}

} // namespace Cadis
