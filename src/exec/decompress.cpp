/*
 * Decompress - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/exec/decompress.hpp>
#include <reqline/util/strings.hpp>
#include <brotli/decode.h>
#include <zlib.h>
#include <array>
#include <memory>
#include <vector>

namespace reqline {

namespace {

// windowBits: 15+32 auto-detects gzip/zlib headers, -15 is raw deflate.
std::string zlib_inflate(const std::string& data, int window_bits, const char* what) {
    z_stream zs{};
    if (inflateInit2(&zs, window_bits) != Z_OK) throw DecodeError(std::string(what) + ": inflateInit2 failed");
    struct Guard { z_stream* s; ~Guard() { inflateEnd(s); } } guard{&zs};

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    std::string out;
    std::array<char, 16384> chunk{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
            throw DecodeError(std::string(what) + ": " + (zs.msg ? zs.msg : "corrupt stream"));
        out.append(chunk.data(), chunk.size() - zs.avail_out);
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)
            throw DecodeError(std::string(what) + ": truncated stream");
    }
    return out;
}

} // namespace

std::string gunzip(const std::string& data) {
    return zlib_inflate(data, 15 + 32, "gzip");
}

std::string inflate_deflate(const std::string& data) {
    // Servers disagree on whether "deflate" carries the zlib header.
    try {
        return zlib_inflate(data, 15, "deflate");
    } catch (const DecodeError&) {
        return zlib_inflate(data, -15, "deflate");
    }
}

std::string brotli_decode(const std::string& data) {
    std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>
        st(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
    if (!st) throw DecodeError("br: cannot create decoder");

    const uint8_t* next_in = reinterpret_cast<const uint8_t*>(data.data());
    size_t avail_in = data.size();
    std::string out;
    std::array<uint8_t, 16384> chunk{};
    while (true) {
        uint8_t* next_out = chunk.data();
        size_t avail_out = chunk.size();
        BrotliDecoderResult r = BrotliDecoderDecompressStream(st.get(), &avail_in, &next_in, &avail_out, &next_out, nullptr);
        out.append(reinterpret_cast<char*>(chunk.data()), chunk.size() - avail_out);
        if (r == BROTLI_DECODER_RESULT_SUCCESS) return out;
        if (r == BROTLI_DECODER_RESULT_ERROR)
            throw DecodeError(std::string("br: ") + BrotliDecoderErrorString(BrotliDecoderGetErrorCode(st.get())));
        if (r == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) throw DecodeError("br: truncated stream");
    }
}

DecodeResult decode_content(const std::string& body, const std::string& content_encoding) {
    DecodeResult res{body, false};
    if (body.empty() || trim(content_encoding).empty()) return res;
    std::vector<std::string> codings;
    for (auto &c : split_top_level(content_encoding, ',')) codings.push_back(to_lower(trim(c)));
    for (auto it = codings.rbegin(); it != codings.rend(); ++it) {
        if (*it == "gzip" || *it == "x-gzip") res.body = gunzip(res.body);
        else if (*it == "deflate") res.body = inflate_deflate(res.body);
        else if (*it == "br") res.body = brotli_decode(res.body);
        else continue;
        res.decoded = true;
    }
    return res;
}

} // namespace reqline
