#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Full-buffer decoders. Each throws DecodeError on a corrupt or truncated stream
// and CapacityError as soon as the output would exceed maxOutput bytes.
std::string gunzip(std::string_view input, size_t maxOutput);
std::string inflateDeflate(std::string_view input, size_t maxOutput); // zlib wrapper, raw deflate fallback
std::string brotliDecompress(std::string_view input, size_t maxOutput);

// Record decompressor: one gzip member to the raw archive record, nullopt when
// the stream is corrupt or larger than maxUncompressed.
std::optional<std::string> decompressRecord(std::string_view compressed, size_t maxUncompressed);
