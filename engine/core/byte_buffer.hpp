#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace engine {

// ============================================================================
// ByteWriter - Serialize WASM binary data (LEB128 varints, names, raw bytes)
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    // --- Primitives ---

    void write_u8(std::uint8_t v) {
        data_.push_back(v);
    }

    // --- Varints ---

    // Unsigned LEB128: 7 data bits per byte, 0x80 marks continuation.
    void write_uleb(std::uint64_t v) {
        do {
            std::uint8_t byte = static_cast<std::uint8_t>(v & 0x7F);
            v >>= 7;
            if (v != 0) byte |= 0x80;
            data_.push_back(byte);
        } while (v != 0);
    }

    void write_sleb(std::int64_t v) {
        bool more = true;
        while (more) {
            std::uint8_t byte = static_cast<std::uint8_t>(v & 0x7F);
            v >>= 7;  // arithmetic shift keeps the sign
            const bool signBit = (byte & 0x40) != 0;
            if ((v == 0 && !signBit) || (v == -1 && signBit)) {
                more = false;
            } else {
                byte |= 0x80;
            }
            data_.push_back(byte);
        }
    }

    // --- Strings ---

    // WASM "name": uleb length followed by UTF-8 bytes.
    void write_name(std::string_view s) {
        write_uleb(s.size());
        data_.insert(data_.end(), s.begin(), s.end());
    }

    // --- Raw bytes ---

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // --- Access ---

    std::size_t size() const { return data_.size(); }
    std::span<const std::uint8_t> data() const { return data_; }
    std::vector<std::uint8_t> take() { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};

} // namespace engine
