#include <ludex/util/thread_name.hpp>

#include <string>

#if defined(_WIN32)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
#elif defined(__linux__) || defined(__APPLE__)
    #include <pthread.h>
#endif

namespace util {

void SetCurrentThreadName(const char *threadName) {
#if defined(_WIN32)
    const int length = MultiByteToWideChar(CP_UTF8, 0, threadName, -1, nullptr, 0);
    if (length <= 0) {
        return;
    }
    std::wstring wideName(static_cast<size_t>(length), L'\0');
    if (MultiByteToWideChar(CP_UTF8, 0, threadName, -1, wideName.data(), length) == length) {
        SetThreadDescription(GetCurrentThread(), wideName.c_str());
    }
#elif defined(__linux__)
    // pthread_setname_np fails with ERANGE above 15 characters plus the terminator
    std::string name{threadName};
    if (name.size() > 15) {
        name.resize(15);
    }
    pthread_setname_np(pthread_self(), name.c_str());
#elif defined(__APPLE__)
    pthread_setname_np(threadName);
#endif
}

} // namespace util
