/** @file
 *****************************************************************************

 Byte buffer helpers: hex formatting for logs and a little-endian
 reader/writer used by the instruction wire format and key blobs.

 *****************************************************************************/

#ifndef HOSTSNARK_BYTE_UTILS_HPP_
#define HOSTSNARK_BYTE_UTILS_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef std::vector<unsigned char> byte_vector;

std::string bytes_to_hex(const byte_vector &bytes);
byte_vector hex_to_bytes(const std::string &hex);

byte_vector slice_bytes(const byte_vector &bytes, size_t offset, size_t length);
void append_bytes(byte_vector &target, const byte_vector &bytes);

template<size_t N>
byte_vector array_to_bytes(const std::array<unsigned char, N> &arr){
    return byte_vector(arr.begin(), arr.end());
}

class byte_writer {
public:
    byte_vector buffer;

    void put_u8(uint8_t value);
    void put_u32(uint32_t value);
    void put_u64(uint64_t value);
    void put_bytes(const byte_vector &bytes);
};

/**
 * Sequential reader over a borrowed buffer. Reading past the end throws
 * format_error, no partial values are returned.
 */
class byte_reader {
private:
    const byte_vector &buffer;
    size_t offset;

    void require(size_t length, const char *what) const;

public:
    explicit byte_reader(const byte_vector &buffer) : buffer(buffer), offset(0) {}

    uint8_t get_u8();
    uint32_t get_u32();
    uint64_t get_u64();
    byte_vector get_bytes(size_t length);

    size_t remaining() const { return buffer.size() - offset; }
    bool at_end() const { return offset == buffer.size(); }
};

#endif // HOSTSNARK_BYTE_UTILS_HPP_
