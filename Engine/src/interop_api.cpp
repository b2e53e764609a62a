#include <interop_api.h>
#include <core/errors.hpp>
#include <lookup/lookup_engine.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

// Thread-local error storage
thread_local std::string g_last_error;
thread_local int g_last_error_code = 0;

const char* cadis_get_last_error() {
    return g_last_error.c_str();
}

int cadis_get_last_error_code() {
    return g_last_error_code;
}

const char* cadis_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
    g_last_error_code = -1;
    if (const auto* ce = dynamic_cast<const Cadis::CadisError*>(&e)) {
        g_last_error_code = static_cast<int>(ce->code());
    }
}

static void set_error(const std::string& message) {
    g_last_error = message;
    g_last_error_code = -1;
}

static void clear_error() {
    g_last_error.clear();
    g_last_error_code = 0;
}

#define INTEROP_TRY_CATCH(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(code) \
    try { \
        code \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

// Helper for string duplication
static char* strdup_safe(const std::string& str) {
#ifdef _WIN32
    return _strdup(str.c_str());
#else
    return strdup(str.c_str());
#endif
}

static CADIS_LOOKUP_STATUS to_c_status(Cadis::LookupStatus status) {
    switch (status) {
        case Cadis::LookupStatus::Ok:      return CADIS_STATUS_OK;
        case Cadis::LookupStatus::Partial: return CADIS_STATUS_PARTIAL;
        default:                           return CADIS_STATUS_NOT_FOUND;
    }
}

// =============================================================================
//  Engine
// =============================================================================

h_cadis_engine_t cadis_engine_create() {
    INTEROP_TRY_CATCH_PTR({
        auto config = Cadis::EngineConfig::from_env();
        config.apply_logging();
        auto* engine = new Cadis::LookupEngine(config);
        clear_error();
        return static_cast<h_cadis_engine_t>(engine);
    })
}

void cadis_engine_destroy(h_cadis_engine_t handle) {
    if (handle) {
        delete static_cast<Cadis::LookupEngine*>(handle);
    }
}

bool cadis_engine_load(h_cadis_engine_t handle, const char* dataset_dir) {
    INTEROP_TRY_CATCH({
        if (!handle || !dataset_dir) {
            set_error("Invalid engine handle or dataset path");
            return false;
        }
        auto* engine = static_cast<Cadis::LookupEngine*>(handle);
        if (!engine->load(dataset_dir)) {
            set_error("Load cancelled");
            return false;
        }
        clear_error();
        return true;
    })
}

uint64_t cadis_engine_generation(h_cadis_engine_t handle) {
    if (!handle) return 0;
    return static_cast<Cadis::LookupEngine*>(handle)->generation();
}

bool cadis_lookup(h_cadis_engine_t handle, double lat, double lon, HLookupResult* out_result) {
    INTEROP_TRY_CATCH({
        if (!handle || !out_result) {
            set_error("Invalid engine handle or result pointer");
            return false;
        }
        auto* engine = static_cast<Cadis::LookupEngine*>(handle);
        auto result = engine->lookup(lat, lon);

        out_result->status = to_c_status(result.status);
        out_result->summary_text = strdup_safe(result.summary_text);
        out_result->iso2 = strdup_safe(result.iso_context.iso2);
        out_result->country_name = strdup_safe(result.iso_context.name);
        out_result->dataset_id = strdup_safe(result.dataset_id);
        out_result->version = strdup_safe(result.version);

        out_result->nodes_count = result.nodes.size();
        if (out_result->nodes_count > 0) {
            out_result->nodes = new HHierarchyNode[out_result->nodes_count];
            for (size_t i = 0; i < out_result->nodes_count; ++i) {
                const auto& node = result.nodes[i];
                out_result->nodes[i].level = node.level;
                out_result->nodes[i].rank = node.rank;
                out_result->nodes[i].name = strdup_safe(node.name);
                out_result->nodes[i].osm_id = strdup_safe(node.id);
                out_result->nodes[i].source = strdup_safe(node.source);
            }
        } else {
            out_result->nodes = nullptr;
        }

        clear_error();
        return true;
    })
}

void cadis_free_result(HLookupResult* result) {
    if (!result) return;

    if (result->nodes) {
        for (size_t i = 0; i < result->nodes_count; ++i) {
            free(result->nodes[i].name);
            free(result->nodes[i].osm_id);
            free(result->nodes[i].source);
        }
        delete[] result->nodes;
    }
    free(result->summary_text);
    free(result->iso2);
    free(result->country_name);
    free(result->dataset_id);
    free(result->version);
    std::memset(result, 0, sizeof(HLookupResult));
}
