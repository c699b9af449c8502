#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace todo {

/*
 * 128-bit identifier. Text form is lowercase hyphenated 8-4-4-4-12.
 */
class Uuid {
public:
    // The nil uuid (all zero)
    Uuid() = default;

    explicit Uuid(const std::array<uint8_t, 16>& bytes) : bytes_(bytes) {}

    // Random RFC 4122 version 4 uuid
    static Uuid generate();

    // Accepts hyphenated and 32-digit simple forms, any case
    static std::optional<Uuid> parse(std::string_view text);

    std::string to_string() const;

    const std::array<uint8_t, 16>& bytes() const noexcept { return bytes_; }
    int version() const noexcept { return bytes_[6] >> 4; }
    bool is_nil() const noexcept;

    friend bool operator==(const Uuid&, const Uuid&) = default;

private:
    std::array<uint8_t, 16> bytes_{};
};

} // namespace todo
