#pragma once

#ifdef _WIN32
    #ifdef INNEROCKET_EXPORTS
        #define IR_API __declspec(dllexport)
    #else
        #define IR_API __declspec(dllimport)
    #endif
#else
    #define IR_API __attribute__((visibility("default")))
#endif
