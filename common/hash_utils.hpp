#pragma once
#include <cstddef>
#include <string>
#include "result.hpp"

class HashUtils {
public:
    // MD5 of the whole file, as lowercase hex. The file is read once, in
    // Config::DIGEST_BUFFER_SIZE pieces.
    static Result<std::string> computeFileDigest(const std::string& filePath);

    static std::string toHex(const unsigned char* bytes, size_t len);
};
