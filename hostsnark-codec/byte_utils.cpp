/** @file
 *****************************************************************************

 Implementation of byte buffer helpers, see byte_utils.hpp

 *****************************************************************************/

#include <libff/common/utils.hpp>

#include "byte_utils.hpp"
#include "errors.hpp"

std::string bytes_to_hex(const byte_vector &bytes){
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(2 * bytes.size());
    for (size_t i = 0; i < bytes.size(); i++){
        result.push_back(digits[bytes[i] >> 4]);
        result.push_back(digits[bytes[i] & 0x0f]);
    }
    return result;
}

static int hex_digit(char c){
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

byte_vector hex_to_bytes(const std::string &hex){
    if (hex.size() % 2 != 0){
        throw format_error("hex string has odd length");
    }
    byte_vector result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2){
        const int hi = hex_digit(hex[i]);
        const int lo = hex_digit(hex[i+1]);
        if (hi < 0 || lo < 0){
            throw format_error(FMT("", "invalid hex digit at position %zu", i));
        }
        result.push_back((unsigned char) ((hi << 4) | lo));
    }
    return result;
}

byte_vector slice_bytes(const byte_vector &bytes, size_t offset, size_t length){
    if (offset > bytes.size() || length > bytes.size() - offset){
        throw format_error(FMT("", "slice [%zu, %zu) out of range for buffer of %zu bytes", offset, offset + length, bytes.size()));
    }
    return byte_vector(bytes.begin() + offset, bytes.begin() + offset + length);
}

void append_bytes(byte_vector &target, const byte_vector &bytes){
    target.insert(target.end(), bytes.begin(), bytes.end());
}

void byte_writer::put_u8(uint8_t value){
    buffer.push_back(value);
}

void byte_writer::put_u32(uint32_t value){
    for (int i = 0; i < 4; i++){
        buffer.push_back((unsigned char) (value >> (8*i)));
    }
}

void byte_writer::put_u64(uint64_t value){
    for (int i = 0; i < 8; i++){
        buffer.push_back((unsigned char) (value >> (8*i)));
    }
}

void byte_writer::put_bytes(const byte_vector &bytes){
    append_bytes(buffer, bytes);
}

void byte_reader::require(size_t length, const char *what) const {
    if (length > remaining()){
        throw format_error(FMT("", "truncated input: %s needs %zu bytes, %zu left", what, length, remaining()));
    }
}

uint8_t byte_reader::get_u8(){
    require(1, "u8");
    return buffer[offset++];
}

uint32_t byte_reader::get_u32(){
    require(4, "u32");
    uint32_t value = 0;
    for (int i = 0; i < 4; i++){
        value |= ((uint32_t) buffer[offset++]) << (8*i);
    }
    return value;
}

uint64_t byte_reader::get_u64(){
    require(8, "u64");
    uint64_t value = 0;
    for (int i = 0; i < 8; i++){
        value |= ((uint64_t) buffer[offset++]) << (8*i);
    }
    return value;
}

byte_vector byte_reader::get_bytes(size_t length){
    require(length, "byte string");
    byte_vector result(buffer.begin() + offset, buffer.begin() + offset + length);
    offset += length;
    return result;
}
