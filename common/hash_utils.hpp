#pragma once
#include <cstddef>
#include <string>
#include "result.hpp"

class HashUtils {
public:

    static std::string toHex(const unsigned char* digest, size_t len) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            result += hex[(digest[i] >> 4) & 0xF];
            result += hex[digest[i] & 0xF];
        }
        return result;
    }

    // MD5 of the whole file, read in Config::CHUNK_SIZE pieces
    static Result<std::string> computeFileDigest(const std::string& filePath);

    // MD5 of an in-memory buffer
    static std::string computeDigest(const char* data, size_t len);

};
