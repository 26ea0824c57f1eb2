// config.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <thread>

namespace Config {
    inline constexpr size_t CHUNK_SIZE = 4096;              // bytes fed to the digest per read
    inline constexpr const char* FAILURE_SENTINEL = "FAILED";  // digest token for a file that could not be hashed
    inline constexpr size_t PROGRESS_STEP = 64;             // files between progress redraws
    inline constexpr size_t MAX_DEFAULT_THREADS = 32;

    // same sizing rule as an I/O bound executor: cores + 4, capped
    inline size_t defaultThreadCount() {
        size_t cores = std::thread::hardware_concurrency();
        if (cores == 0) cores = 4;
        return std::min(MAX_DEFAULT_THREADS, cores + 4);
    }
}
