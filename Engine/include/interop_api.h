#pragma once

#if defined(_WIN32)
    #if defined(CADIS_EXPORT)
        #define CADIS_C_API __declspec(dllexport)
    #else
        #define CADIS_C_API __declspec(dllimport)
    #endif
#else
    #define CADIS_C_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage
CADIS_C_API const char* cadis_get_last_error();
CADIS_C_API const char* cadis_get_version();

// Numeric ErrorCode of the last failure on this thread, 0 when none
CADIS_C_API int cadis_get_last_error_code();

// =============================================================================
//  Engine
// =============================================================================

typedef void* h_cadis_engine_t;

typedef enum {
    CADIS_STATUS_OK = 0,
    CADIS_STATUS_PARTIAL = 1,
    CADIS_STATUS_NOT_FOUND = 2
} CADIS_LOOKUP_STATUS;

typedef struct HHierarchyNode {
    int level;
    int rank;
    char* name;
    char* osm_id;
    char* source;
} HHierarchyNode;

typedef struct HLookupResult {
    CADIS_LOOKUP_STATUS status;
    HHierarchyNode* nodes;
    size_t nodes_count;
    char* summary_text;
    char* iso2;
    char* country_name;
    char* dataset_id;
    char* version;
} HLookupResult;

// Configuration comes from CADIS_* environment variables
CADIS_C_API h_cadis_engine_t cadis_engine_create();
CADIS_C_API void cadis_engine_destroy(h_cadis_engine_t handle);

// Returns false on failure; the previously loaded dataset stays active
CADIS_C_API bool cadis_engine_load(h_cadis_engine_t handle, const char* dataset_dir);
CADIS_C_API uint64_t cadis_engine_generation(h_cadis_engine_t handle);

CADIS_C_API bool cadis_lookup(h_cadis_engine_t handle, double lat, double lon, HLookupResult* out_result);
CADIS_C_API void cadis_free_result(HLookupResult* result);

#ifdef __cplusplus
}
#endif
