/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "crypto/rotor_cipher.h"

#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace nxm::crypto {
namespace {
constexpr std::int32_t kPrimeX = 30269;
constexpr std::int32_t kPrimeY = 30307;
constexpr std::int32_t kPrimeZ = 30323;

std::int32_t floor_div(std::int32_t a, std::int32_t b) {
    std::int32_t q = a / b;
    if ((a % b != 0) && (a < 0)) {
        q--;
    }
    return q;
}

std::int32_t floor_mod(std::int32_t a, std::int32_t b) {
    const std::int32_t m = a % b;
    return m < 0 ? m + b : m;
}

std::uint32_t rotl3_16(std::uint32_t v) {
    return (v << 3) | (v >> 13);
}

std::int32_t to_signed_16(std::uint32_t v) {
    return v > 0x7FFFu ? static_cast<std::int32_t>(v) - 0x10000 : static_cast<std::int32_t>(v);
}

std::span<const std::uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}
}  // namespace

RotorRandom RotorRandom::from_key(std::span<const std::uint8_t> key) {
    std::uint32_t x = 995;
    std::uint32_t y = 576;
    std::uint32_t z = 767;
    for (const std::uint8_t c : key) {
        x = (rotl3_16(x) + c) & 0xFFFFu;
        y = (rotl3_16(y) ^ c) & 0xFFFFu;
        z = (rotl3_16(z) - c) & 0xFFFFu;
    }

    std::int32_t sx = to_signed_16(x);
    std::int32_t sy = to_signed_16(y);
    std::int32_t sz = to_signed_16(z);
    sy |= 1;

    sx = 171 * floor_mod(sx, 177) - 2 * floor_div(sx, 177);
    sy = 172 * floor_mod(sy, 176) - 35 * floor_div(sy, 176);
    sz = 170 * floor_mod(sz, 178) - 63 * floor_div(sz, 178);
    if (sx < 0) {
        sx += kPrimeX;
    }
    if (sy < 0) {
        sy += kPrimeY;
    }
    if (sz < 0) {
        sz += kPrimeZ;
    }
    return RotorRandom(sx, sy, sz);
}

std::uint32_t RotorRandom::next(std::uint32_t n) {
    if (n == 0) {
        throw std::invalid_argument("RotorRandom bound must be > 0");
    }
    const double v = static_cast<double>(_x) / kPrimeX + static_cast<double>(_y) / kPrimeY
                     + static_cast<double>(_z) / kPrimeZ;
    _x = (171 * _x) % kPrimeX;
    _y = (172 * _y) % kPrimeY;
    _z = (170 * _z) % kPrimeZ;
    return static_cast<std::uint32_t>(static_cast<std::uint64_t>(v * n) % n);
}

RotorTables build_rotor_tables(std::span<const std::uint8_t> key, int rotor_count) {
    constexpr std::size_t size = RotorTables::kSize;
    RotorRandom rand = RotorRandom::from_key(key);

    RotorTables t{};
    t.encrypt.reserve(static_cast<std::size_t>(rotor_count));
    t.decrypt.reserve(static_cast<std::size_t>(rotor_count));
    for (int r = 0; r < rotor_count; r++) {
        t.initial_positions.push_back(static_cast<std::uint16_t>(rand.next(size)));

        std::vector<std::uint16_t> e(size + 1);
        std::iota(e.begin(), e.end(), std::uint16_t{0});
        std::vector<std::uint16_t> d = e;
        const auto increment = static_cast<std::uint16_t>(1 + 2 * rand.next(size / 2));
        e[size] = increment;
        d[size] = increment;

        // Knuth shuffle over [0, size); d tracks the inverse as slots settle.
        std::size_t i = size;
        while (i > 1) {
            const std::size_t j = rand.next(static_cast<std::uint32_t>(i));
            i--;
            std::swap(e[j], e[i]);
            d[e[i]] = static_cast<std::uint16_t>(i);
        }
        d[e[0]] = 0;

        t.encrypt.push_back(std::move(e));
        t.decrypt.push_back(std::move(d));
    }
    return t;
}

RotorCipher::RotorCipher(std::string_view key, int rotor_count)
    : RotorCipher(as_bytes(key), rotor_count) {}

RotorCipher::RotorCipher(std::span<const std::uint8_t> key, int rotor_count)
    : _key(key.begin(), key.end()), _rotor_count(rotor_count) {
    if (rotor_count < 1) {
        throw std::invalid_argument(
            std::string("rotor_count must be >= 1, got ") + std::to_string(rotor_count)
        );
    }
}

void RotorCipher::set_key(std::string_view key) {
    set_key(as_bytes(key));
}

void RotorCipher::set_key(std::span<const std::uint8_t> key) {
    _key.assign(key.begin(), key.end());
    _tables.reset();
    _positions[0].reset();
    _positions[1].reset();
}

void RotorCipher::reset() {
    _positions[0].reset();
    _positions[1].reset();
}

const RotorTables& RotorCipher::tables() {
    if (!_tables.has_value()) {
        _tables = build_rotor_tables(_key, _rotor_count);
    }
    return *_tables;
}

std::vector<std::uint16_t>& RotorCipher::positions(bool do_decrypt) {
    auto& slot = _positions[do_decrypt ? 1 : 0];
    if (!slot.has_value()) {
        slot = tables().initial_positions;
    }
    return *slot;
}

void RotorCipher::crypt(std::span<std::uint8_t> data, bool do_decrypt) {
    constexpr std::uint32_t size = RotorTables::kSize;
    const auto& t = tables();
    const auto& rotors = do_decrypt ? t.decrypt : t.encrypt;
    auto& pos = positions(do_decrypt);
    const std::size_t nr = rotors.size();

    for (auto& byte : data) {
        std::uint32_t c = byte;
        if (do_decrypt) {
            for (std::size_t i = nr; i > 0; i--) {
                c = pos[i - 1] ^ rotors[i - 1][c];
            }
        } else {
            for (std::size_t i = 0; i < nr; i++) {
                c = rotors[i][c ^ pos[i]];
            }
        }
        byte = static_cast<std::uint8_t>(c);

        // odometer step; an overflow past size carries into the next rotor
        std::uint32_t pnew = 0;
        for (std::size_t i = 0; i < nr; i++) {
            pnew = ((pos[i] + (pnew >= size ? 1u : 0u)) & 0xFFu) + rotors[i][size];
            pos[i] = static_cast<std::uint16_t>(pnew % size);
        }
    }
}

void RotorCipher::encrypt_in_place(std::span<std::uint8_t> data) {
    crypt(data, false);
}

void RotorCipher::decrypt_in_place(std::span<std::uint8_t> data) {
    crypt(data, true);
}

std::vector<std::uint8_t> RotorCipher::encrypt(std::span<const std::uint8_t> data) {
    std::vector<std::uint8_t> out(data.begin(), data.end());
    crypt(out, false);
    return out;
}

std::vector<std::uint8_t> RotorCipher::decrypt(std::span<const std::uint8_t> data) {
    std::vector<std::uint8_t> out(data.begin(), data.end());
    crypt(out, true);
    return out;
}

std::vector<std::uint8_t> rotor_encrypt(std::string_view key, std::span<const std::uint8_t> data) {
    RotorCipher cipher(key);
    return cipher.encrypt(data);
}

std::vector<std::uint8_t> rotor_decrypt(std::string_view key, std::span<const std::uint8_t> data) {
    RotorCipher cipher(key);
    return cipher.decrypt(data);
}
}  // namespace nxm::crypto
