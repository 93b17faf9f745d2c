#pragma once

#include <string>

namespace katsu {

struct HashResult {
    bool ok = false;
    std::string hex_digest;
    std::string error;
};

// BLAKE2b-512 of a file as lowercase hex (the first column of b2sum)
HashResult compute_blake2b512(const std::string& file_path);

// BLAKE2b-512 of an in-memory buffer
HashResult compute_blake2b512_data(const std::string& data);

} // namespace katsu
