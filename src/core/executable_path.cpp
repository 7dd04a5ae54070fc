// src/core/executable_path.cpp
#include "executable_path.h"
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#else
#include <limits.h>
#include <unistd.h>
#endif

namespace mcpmail::core {

    std::string executable_path() {
#ifdef _WIN32
        char path[MAX_PATH];
        DWORD count = GetModuleFileNameA(nullptr, path, MAX_PATH);
        return count == 0 ? "" : std::string(path, count);
#else
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        return count > 0 ? std::string(result, static_cast<size_t>(count)) : "";
#endif
    }

    std::string executable_directory() {
        std::string exec_path = executable_path();
        if (exec_path.empty()) {
            return "";
        }
        return std::filesystem::path(exec_path).parent_path().string();
    }

}// namespace mcpmail::core
