/**
 * @file stream.hpp
 * @brief Потоки чтения/записи для канонического кодирования
 *
 * Предоставляет классы для чтения и записи бинарных данных
 * с числовыми полями в little-endian.
 */

#pragma once

#include "../types.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace powledger::core::serialization {

/**
 * @brief Исключение при ошибке чтения
 *
 * Выбрасывается только ReadStream; кодек транзакций преобразует его
 * в ErrorCode::MalformedInput.
 */
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Поток для чтения бинарных данных
 */
class ReadStream {
public:
    explicit ReadStream(ByteSpan data) noexcept
        : data_(data), pos_(0) {}

    explicit ReadStream(const Bytes& data) noexcept
        : data_(data), pos_(0) {}

    [[nodiscard]] uint8_t read_u8();
    [[nodiscard]] uint32_t read_u32_le();
    [[nodiscard]] uint64_t read_u64_le();

    /**
     * @brief Прочитать массив байт фиксированной длины
     */
    [[nodiscard]] Bytes read_bytes(std::size_t count);

    /**
     * @brief Прочитать 32 байта как Hash256 (без реверса)
     */
    [[nodiscard]] Hash256 read_hash256();

    [[nodiscard]] std::size_t remaining() const noexcept;
    [[nodiscard]] bool eof() const noexcept;

private:
    void ensure_available(std::size_t count);

    ByteSpan data_;
    std::size_t pos_;
};

/**
 * @brief Поток для записи бинарных данных
 */
class WriteStream {
public:
    WriteStream() = default;

    /**
     * @brief Создать поток с предварительно выделенной памятью
     */
    explicit WriteStream(std::size_t reserve_size);

    void write_u8(uint8_t value);
    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);
    void write_bytes(ByteSpan data);
    void write_hash256(const Hash256& hash);

    [[nodiscard]] const Bytes& data() const noexcept;

    /**
     * @brief Получить записанные данные (перемещение)
     */
    [[nodiscard]] Bytes take_data() noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    Bytes data_;
};

} // namespace powledger::core::serialization
