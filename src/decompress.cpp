#include "decompress.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <brotli/decode.h>
#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <memory>

namespace {

constexpr size_t kChunkSize = 32768;

struct InflateStream {
    z_stream zs;
    bool open = false;

    explicit InflateStream(int windowBits) {
        std::memset(&zs, 0, sizeof(zs));
        if (inflateInit2(&zs, windowBits) != Z_OK) {
            throw DecodeError("inflateInit2 failed");
        }
        open = true;
    }
    ~InflateStream() {
        if (open) inflateEnd(&zs);
    }
};

std::string zlibInflate(std::string_view input, size_t maxOutput, int windowBits, const char* what) {
    InflateStream stream(windowBits);
    z_stream& zs = stream.zs;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string out;
    char buf[kChunkSize];
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw DecodeError(std::string(what) + ": inflate failed (" + std::to_string(ret) + ")");
        }
        size_t produced = sizeof(buf) - zs.avail_out;
        if (out.size() + produced > maxOutput) {
            throw CapacityError(std::string(what) + ": output exceeds " + std::to_string(maxOutput) + " bytes");
        }
        out.append(buf, produced);
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0) {
            throw DecodeError(std::string(what) + ": truncated stream");
        }
    } while (ret != Z_STREAM_END);
    return out;
}

} // namespace

std::string gunzip(std::string_view input, size_t maxOutput) {
    return zlibInflate(input, maxOutput, 15 + 16, "gzip");
}

std::string inflateDeflate(std::string_view input, size_t maxOutput) {
    try {
        return zlibInflate(input, maxOutput, 15, "deflate");
    } catch (const DecodeError&) {
        // Some servers send raw deflate without the zlib header.
        return zlibInflate(input, maxOutput, -15, "deflate");
    }
}

std::string brotliDecompress(std::string_view input, size_t maxOutput) {
    std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state(
        BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
    if (!state) throw DecodeError("brotli: failed to create decoder");

    size_t availIn = input.size();
    const uint8_t* nextIn = reinterpret_cast<const uint8_t*>(input.data());
    std::string out;
    uint8_t buf[kChunkSize];

    while (true) {
        size_t availOut = sizeof(buf);
        uint8_t* nextOut = buf;
        BrotliDecoderResult r = BrotliDecoderDecompressStream(state.get(), &availIn, &nextIn,
                                                              &availOut, &nextOut, nullptr);
        size_t produced = sizeof(buf) - availOut;
        if (out.size() + produced > maxOutput) {
            throw CapacityError("brotli: output exceeds " + std::to_string(maxOutput) + " bytes");
        }
        out.append(reinterpret_cast<char*>(buf), produced);

        if (r == BROTLI_DECODER_RESULT_SUCCESS) return out;
        if (r == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) continue;
        if (r == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) throw DecodeError("brotli: truncated stream");
        throw DecodeError(std::string("brotli: ") +
                          BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
    }
}

std::optional<std::string> decompressRecord(std::string_view compressed, size_t maxUncompressed) {
    try {
        Utils::ScopedTimer t("Decompress");
        return gunzip(compressed, maxUncompressed);
    } catch (const CcsiftError& e) {
        Utils::log(Utils::LogLevel::Debug, "record", e.what());
        return std::nullopt;
    }
}
