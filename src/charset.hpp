#pragma once

#include "warc.hpp"

#include <cstddef>
#include <string>
#include <string_view>

// Bytes of the body scanned for <meta> charset declarations.
constexpr size_t kSniffPrefixBytes = 4096;

std::string charsetFromContentType(std::string_view contentType);
std::string charsetFromMeta(std::string_view body); // first kSniffPrefixBytes only

// Header charset, then <meta charset>, then <meta http-equiv content-type>,
// else "utf-8". Returned lowercased.
std::string resolveCharset(std::string_view body, const HeaderMap& headers);

// Replaces invalid UTF-8 sequences with U+FFFD.
std::string sanitizeUtf8(std::string_view bytes);

// Converts bytes in `charset` to UTF-8. Unknown charsets and undecodable
// input fall back to best-effort UTF-8; never throws.
std::string decodeToUtf8(std::string_view bytes, const std::string& charset);

std::string decodeText(std::string_view body, const HeaderMap& headers);
