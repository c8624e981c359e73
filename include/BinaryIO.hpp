/**
 * @file BinaryIO.hpp
 * @brief Helpers for the binary artifact formats
 *
 * Giá trị được ghi theo byte order của máy (little-endian trên x86/ARM).
 *
 * @author Research Team
 * @date 2026
 */

#ifndef BINARY_IO_HPP
#define BINARY_IO_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>

namespace orca {
namespace binary {

template <typename T>
void writeValue(std::ostream& out, const T& value) {
    static_assert(std::is_trivially_copyable<T>::value, "POD only");
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool readValue(std::istream& in, T& value) {
    static_assert(std::is_trivially_copyable<T>::value, "POD only");
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return static_cast<bool>(in);
}

inline void writeString(std::ostream& out, const std::string& s) {
    writeValue(out, static_cast<uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

/**
 * @brief Đọc chuỗi có tiền tố độ dài uint32; false nếu vượt maxLength hoặc EOF
 */
inline bool readString(std::istream& in, std::string& s, uint32_t maxLength) {
    uint32_t length = 0;
    if (!readValue(in, length) || length > maxLength) {
        return false;
    }
    s.resize(length);
    if (length > 0) {
        in.read(&s[0], static_cast<std::streamsize>(length));
    }
    return static_cast<bool>(in);
}

/**
 * @brief Kiểm tra magic 8 byte ở đầu file
 */
inline bool readMagic(std::istream& in, const char (&magic)[9]) {
    char buffer[8];
    in.read(buffer, sizeof(buffer));
    if (!in) return false;
    for (int i = 0; i < 8; ++i) {
        if (buffer[i] != magic[i]) return false;
    }
    return true;
}

inline void writeMagic(std::ostream& out, const char (&magic)[9]) {
    out.write(magic, 8);
}

} // namespace binary
} // namespace orca

#endif // BINARY_IO_HPP
