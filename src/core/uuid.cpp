#include "todo/uuid.hpp"

#include <random>

namespace todo {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool is_hyphen_position(size_t pos) {
    return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

} // namespace


Uuid Uuid::generate() {
    // One engine per thread, workers generate ids concurrently
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(engine);
    uint64_t lo = dist(engine);

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
        bytes[i + 8] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC 4122 variant
    return Uuid{bytes};
}

std::optional<Uuid> Uuid::parse(std::string_view text) {
    bool hyphenated = text.size() == 36;
    if (!hyphenated && text.size() != 32)
        return std::nullopt;

    std::array<uint8_t, 16> bytes{};
    size_t nibble = 0;
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (hyphenated && is_hyphen_position(pos)) {
            if (text[pos] != '-')
                return std::nullopt;
            continue;
        }

        int value = hex_value(text[pos]);
        if (value < 0)
            return std::nullopt;

        if (nibble % 2 == 0)
            bytes[nibble / 2] = static_cast<uint8_t>(value << 4);
        else
            bytes[nibble / 2] |= static_cast<uint8_t>(value);
        ++nibble;
    }

    return Uuid{bytes};
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHexDigits[bytes_[i] >> 4]);
        out.push_back(kHexDigits[bytes_[i] & 0x0F]);
    }
    return out;
}

bool Uuid::is_nil() const noexcept {
    for (auto b : bytes_) {
        if (b != 0)
            return false;
    }
    return true;
}

} // namespace todo
