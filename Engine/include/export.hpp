#pragma once

#ifndef CADIS_API
#if defined(_WIN32)
    #if defined(CADIS_EXPORT)
        #define CADIS_API __declspec(dllexport)
    #else
        #define CADIS_API __declspec(dllimport)
    #endif
#else
    #define CADIS_API __attribute__((visibility("default")))
#endif
#endif
