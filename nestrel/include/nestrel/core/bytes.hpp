/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */
#pragma once

#include <cstdint>
#include <vector>
#include <span>

namespace nestrel::core {

    using byte = std::byte;
    using byte_buffer = std::vector<byte>;
    using byte_view = std::span<const byte>;
    using byte_span = std::span<byte>;

    inline byte_view as_bytes(const byte_buffer& buf) noexcept {
        return byte_view{ buf.data(), buf.size() };
    }

} // namespace nestrel::core
