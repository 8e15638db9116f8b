/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "crypto/mesh_hash.h"

namespace nxm::crypto {
namespace {
constexpr std::uint32_t kSentinel0 = 0x9BE74448u;
constexpr std::uint32_t kSentinel1 = 0x66F42C48u;
constexpr std::uint32_t kHashSeed = 0xF4FA8928u;
constexpr std::uint32_t kStateSeed = 0x37A8470Eu;
constexpr std::uint32_t kTweakSeed = 0x7758B42Bu;
constexpr std::uint32_t kRoundKey = 0x267B0B11u;

std::uint32_t lo32(std::uint64_t v) {
    return static_cast<std::uint32_t>(v & 0xFFFFFFFFu);
}

std::uint32_t hi32(std::uint64_t v) {
    return static_cast<std::uint32_t>(v >> 32);
}
}  // namespace

std::string normalize_hash_input(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c >= 0x80u) {
            continue;
        }
        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c + 32));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::vector<std::uint32_t> mesh_hash_words(std::string_view text) {
    const std::string raw = normalize_hash_input(text);
    const std::size_t word_count = (raw.size() + 3) / 4;

    std::vector<std::uint32_t> words(word_count, 0);
    for (std::size_t i = 0; i < raw.size(); i++) {
        words[i / 4] |= static_cast<std::uint32_t>(static_cast<unsigned char>(raw[i]))
                        << (8 * (i % 4));
    }
    words.push_back(kSentinel0);
    words.push_back(kSentinel1);
    return words;
}

std::uint32_t mesh_hash(std::string_view text) {
    std::uint32_t hash = kHashSeed;
    std::uint32_t state = kStateSeed;
    std::uint32_t tweak = kTweakSeed;

    for (const std::uint32_t word : mesh_hash_words(text)) {
        hash = (hash << 1) | (hash >> 31);
        const std::uint32_t e = kRoundKey ^ hash;

        state ^= word;
        tweak ^= word;

        // state: low + high of (b * state), each half bumped when the other carried
        std::uint32_t b = ((e + tweak) | 0x02040801u) & 0xBFEF7FDFu;
        std::uint64_t f = static_cast<std::uint64_t>(b) * state;
        std::uint32_t a = lo32(f);
        b = hi32(f);
        if (b != 0) {
            a++;
        }
        f = static_cast<std::uint64_t>(a) + b;
        a = lo32(f);
        if (hi32(f) != 0) {
            a++;
        }

        b = ((e + state) | 0x00804021u) & 0x7DFEFBFFu;
        state = a;

        // tweak: low + 2 * high of (tweak * b), with the legacy +1 / +2 carries
        f = static_cast<std::uint64_t>(tweak) * b;
        a = lo32(f);
        b = hi32(f);
        f = static_cast<std::uint64_t>(b) + b;
        b = lo32(f);
        if (hi32(f) != 0) {
            a++;
        }
        f = static_cast<std::uint64_t>(a) + b;
        a = lo32(f);
        if (hi32(f) != 0) {
            a += 2;
        }
        tweak = a;
    }
    return state ^ tweak;
}
}  // namespace nxm::crypto
