#pragma once

#if defined(BEDROCKKIT_SHARED)
    #if defined(_MSC_VER)
        #if defined(BEDROCKKIT_BUILDING)
            #define BEDROCKKIT_API __declspec(dllexport)
        #else
            #define BEDROCKKIT_API __declspec(dllimport)
        #endif
    #elif defined(__GNUC__) || defined(__clang__)
        #if defined(BEDROCKKIT_BUILDING)
            #define BEDROCKKIT_API __attribute__((visibility("default")))
        #else
            #define BEDROCKKIT_API
        #endif
    #else
        #define BEDROCKKIT_API
    #endif
#else
    #define BEDROCKKIT_API
#endif
