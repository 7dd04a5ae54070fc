// src/core/executable_path.h
#pragma once
#include <string>

namespace mcpmail::core {

    // Full path of the running executable, empty if it cannot be determined
    std::string executable_path();

    // Directory holding the running executable, empty if unknown
    std::string executable_directory();

}// namespace mcpmail::core
