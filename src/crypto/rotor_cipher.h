/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nxm::crypto {
// Three-prime combined multiplicative congruential generator seeded from a key.
class RotorRandom {
   public:
    RotorRandom(std::int32_t x, std::int32_t y, std::int32_t z) : _x(x), _y(y), _z(z) {}

    static RotorRandom from_key(std::span<const std::uint8_t> key);

    // Returns a value in [0, n) and advances the state.
    std::uint32_t next(std::uint32_t n);

    std::int32_t x() const { return _x; }
    std::int32_t y() const { return _y; }
    std::int32_t z() const { return _z; }

   private:
    std::int32_t _x;
    std::int32_t _y;
    std::int32_t _z;
};

struct RotorTables {
    static constexpr std::size_t kSize = 256;

    // size + 1 slots per rotor; slot kSize holds the position increment.
    std::vector<std::vector<std::uint16_t>> encrypt;
    std::vector<std::vector<std::uint16_t>> decrypt;
    std::vector<std::uint16_t> initial_positions;

    bool operator==(const RotorTables&) const = default;
};

RotorTables build_rotor_tables(std::span<const std::uint8_t> key, int rotor_count);

// Rotor-machine stream cipher. Encryption and decryption keep separate
// position cursors, so successive calls in one direction continue the stream.
// Instances are not thread-safe.
class RotorCipher {
   public:
    static constexpr int kDefaultRotorCount = 6;

    explicit RotorCipher(std::string_view key, int rotor_count = kDefaultRotorCount);
    RotorCipher(std::span<const std::uint8_t> key, int rotor_count);

    // Drops derived rotors and both cursors.
    void set_key(std::string_view key);
    void set_key(std::span<const std::uint8_t> key);

    // Rewinds both cursors to the initial rotor positions.
    void reset();

    std::vector<std::uint8_t> encrypt(std::span<const std::uint8_t> data);
    std::vector<std::uint8_t> decrypt(std::span<const std::uint8_t> data);
    void encrypt_in_place(std::span<std::uint8_t> data);
    void decrypt_in_place(std::span<std::uint8_t> data);

    int rotor_count() const { return _rotor_count; }
    const RotorTables& tables();

   private:
    void crypt(std::span<std::uint8_t> data, bool do_decrypt);
    std::vector<std::uint16_t>& positions(bool do_decrypt);

    std::vector<std::uint8_t> _key;
    int _rotor_count;
    std::optional<RotorTables> _tables;
    std::optional<std::vector<std::uint16_t>> _positions[2];
};

// One-shot helpers on a fresh cipher.
std::vector<std::uint8_t> rotor_encrypt(std::string_view key, std::span<const std::uint8_t> data);
std::vector<std::uint8_t> rotor_decrypt(std::string_view key, std::span<const std::uint8_t> data);
}  // namespace nxm::crypto
