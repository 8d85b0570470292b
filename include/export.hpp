#pragma once

#if defined(_WIN32)
    #if defined(SIXDEGREES_EXPORT)
        #define SIXDEGREES_API __declspec(dllexport)
    #else
        #define SIXDEGREES_API __declspec(dllimport)
    #endif
#else
    #define SIXDEGREES_API __attribute__((visibility("default")))
#endif
