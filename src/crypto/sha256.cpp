/**
 * @file sha256.cpp
 * @brief Программная реализация SHA256
 *
 * Алгоритм соответствует FIPS 180-4.
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"
#include "../core/hex.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace powledger::crypto {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)
[[nodiscard]] constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

[[nodiscard]] constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // anonymous namespace

// =============================================================================
// SHA256 Transform
// =============================================================================

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    // Расписание сообщения (message schedule)
    std::array<uint32_t, 64> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    // Рабочие переменные a..h
    Sha256State v = state;

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = v[7] + big_sigma1(v[4]) + ch(v[4], v[5], v[6]) +
                      constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(v[0]) + maj(v[0], v[1], v[2]);
        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += v[i];
    }
}

// =============================================================================
// Sha256 (потоковый)
// =============================================================================

Sha256::Sha256() noexcept {
    reset();
}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_len_ = 0;
}

Sha256& Sha256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_len_ += len;

    // Дополняем буфер, оставшийся с прошлого вызова
    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Полные блоки напрямую из входа
    while (len >= constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
        len -= constants::SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Sha256& Sha256::update(std::string_view data) noexcept {
    return update(ByteSpan(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_len_ * 8;

    // 0x80 + нули до 56 байт (mod 64) + длина в битах (big-endian)
    buffer_[buffered_++] = 0x80;
    if (buffered_ > 56) {
        std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.end(), 0);
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.begin() + 56, 0);
    write_be32(buffer_.data() + 56, static_cast<uint32_t>(bit_len >> 32));
    write_be32(buffer_.data() + 60, static_cast<uint32_t>(bit_len));
    sha256_transform(state_, buffer_.data());

    Hash256 result;
    for (std::size_t i = 0; i < state_.size(); ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }

    reset();
    return result;
}

// =============================================================================
// Однократные функции
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 sha256(std::string_view data) noexcept {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 sha256d(ByteSpan data) noexcept {
    Hash256 first = sha256(data);
    return sha256(ByteSpan(first.data(), first.size()));
}

std::string sha256_hex(std::string_view data) {
    return to_hex(sha256(data));
}

} // namespace powledger::crypto
