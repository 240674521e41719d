#pragma once
#include <mutex>
#include <iostream>

using namespace std;

// Shared by every writer to cout/cerr so lines from the UI thread,
// the runtime thread and the logger thread never interleave
inline mutex g_logMutex;

#define SAFE_COUT(x)                        \
    {                                       \
        lock_guard<mutex> lock(g_logMutex); \
        cout << x << endl;                  \
    }

#define SAFE_CERR(msg)                      \
    {                                       \
        lock_guard<mutex> lock(g_logMutex); \
        cerr << msg << endl;                \
    }
