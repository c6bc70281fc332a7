#pragma once

#if defined(_WIN32) && !defined(DEVRUN_STATIC)
    #ifdef DEVRUN_BUILDING_DLL
        #define DEVRUN_API __declspec(dllexport)
    #else
        #define DEVRUN_API __declspec(dllimport)
    #endif
#else
    #define DEVRUN_API
#endif
