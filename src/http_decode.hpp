#pragma once

#include "warc.hpp"

#include <cstddef>
#include <string>
#include <string_view>

// Reassembles a chunked body; stops at the zero-size chunk or at the first
// malformed size line, keeping whatever was decoded before it.
std::string decodeChunked(std::string_view body);

// Undoes transfer coding and then content coding (gzip, br, deflate).
// A corrupt content coding leaves the bytes as they were; output larger than
// maxOutput throws CapacityError.
std::string decodeBody(std::string_view body, const HeaderMap& headers, size_t maxOutput);
