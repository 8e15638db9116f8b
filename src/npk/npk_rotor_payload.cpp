/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "npk/npk_rotor_payload.h"
#include "crypto/rotor_cipher.h"
#include "meta/meta_errors.h"

#include <zlib.h>

#include <algorithm>

namespace nxm::npk {
bool is_rotor_payload(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < 2) {
        return false;
    }
    return (bytes[0] == 0x1D && bytes[1] == 0x04) || (bytes[0] == 0x15 && bytes[1] == 0x23);
}

const std::string& default_rotor_key() {
    static const std::string key = [] {
        const std::string dn = "j2h56ogodh3se";
        const std::string dt = "=dziaq.";
        const std::string df = "|os=5v7!\"-234";
        std::string k;
        for (int i = 0; i < 4; i++) {
            k += dn;
        }
        for (int i = 0; i < 5; i++) {
            k += dt + dn + df;
        }
        k += "!#";
        for (int i = 0; i < 7; i++) {
            k += dt;
        }
        k += df + df;
        k += "*&'";
        return k;
    }();
    return key;
}

std::vector<std::uint8_t> zlib_inflate(std::span<const std::uint8_t> src) {
    z_stream strm{};
    if (inflateInit(&strm) != Z_OK) {
        throw meta::FormatError("zlib inflateInit failed");
    }

    strm.next_in = const_cast<Bytef*>(src.data());
    strm.avail_in = static_cast<uInt>(src.size());

    std::vector<std::uint8_t> out;
    std::uint8_t chunk[32768];
    int ret = Z_OK;
    do {
        strm.next_out = chunk;
        strm.avail_out = static_cast<uInt>(sizeof(chunk));
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR
            || ret == Z_NEED_DICT) {
            const std::string msg = strm.msg ? strm.msg : "unknown error";
            inflateEnd(&strm);
            throw meta::FormatError("zlib inflate failed: " + msg, strm.total_in);
        }
        const std::size_t produced = sizeof(chunk) - strm.avail_out;
        out.insert(out.end(), chunk, chunk + produced);
        if (ret == Z_BUF_ERROR && strm.avail_in == 0) {
            inflateEnd(&strm);
            throw meta::FormatError("zlib stream truncated", strm.total_in);
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return out;
}

void unscramble_tail(std::vector<std::uint8_t>& data) {
    const std::size_t n = std::min(data.size(), kReversedXorSpan);
    for (std::size_t i = 0; i < n; i++) {
        data[i] ^= kReversedXorKey;
    }
    std::reverse(data.begin(), data.end());
}

std::vector<std::uint8_t>
unpack_rotor_payload(std::span<const std::uint8_t> bytes, std::string_view key) {
    crypto::RotorCipher cipher(key);
    const auto compressed = cipher.decrypt(bytes);
    auto out = zlib_inflate(compressed);
    unscramble_tail(out);
    return out;
}
}  // namespace nxm::npk
