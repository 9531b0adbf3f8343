/**
 * @file stream.cpp
 * @brief Реализация потоков сериализации
 */

#include "stream.hpp"
#include "../byte_order.hpp"

#include <cstring>
#include <format>

namespace powledger::core::serialization {

// =============================================================================
// ReadStream
// =============================================================================

void ReadStream::ensure_available(std::size_t count) {
    if (count > data_.size() - pos_) {
        throw StreamError(std::format(
            "Неожиданный конец данных: нужно {} байт на позиции {}, доступно {}",
            count, pos_, data_.size() - pos_));
    }
}

uint8_t ReadStream::read_u8() {
    ensure_available(1);
    return data_[pos_++];
}

uint32_t ReadStream::read_u32_le() {
    ensure_available(4);
    uint32_t result = read_le32(data_.data() + pos_);
    pos_ += 4;
    return result;
}

uint64_t ReadStream::read_u64_le() {
    ensure_available(8);
    uint64_t result = read_le64(data_.data() + pos_);
    pos_ += 8;
    return result;
}

Bytes ReadStream::read_bytes(std::size_t count) {
    ensure_available(count);
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
    Bytes result(first, first + static_cast<std::ptrdiff_t>(count));
    pos_ += count;
    return result;
}

Hash256 ReadStream::read_hash256() {
    ensure_available(32);
    Hash256 result;
    std::memcpy(result.data(), data_.data() + pos_, 32);
    pos_ += 32;
    return result;
}

std::size_t ReadStream::remaining() const noexcept {
    return data_.size() - pos_;
}

bool ReadStream::eof() const noexcept {
    return pos_ >= data_.size();
}

// =============================================================================
// WriteStream
// =============================================================================

WriteStream::WriteStream(std::size_t reserve_size) {
    data_.reserve(reserve_size);
}

void WriteStream::write_u8(uint8_t value) {
    data_.push_back(value);
}

void WriteStream::write_u32_le(uint32_t value) {
    std::array<uint8_t, 4> buf;
    write_le32(buf.data(), value);
    write_bytes(buf);
}

void WriteStream::write_u64_le(uint64_t value) {
    std::array<uint8_t, 8> buf;
    write_le64(buf.data(), value);
    write_bytes(buf);
}

void WriteStream::write_bytes(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void WriteStream::write_hash256(const Hash256& hash) {
    data_.insert(data_.end(), hash.begin(), hash.end());
}

const Bytes& WriteStream::data() const noexcept {
    return data_;
}

Bytes WriteStream::take_data() noexcept {
    return std::move(data_);
}

std::size_t WriteStream::size() const noexcept {
    return data_.size();
}

} // namespace powledger::core::serialization
