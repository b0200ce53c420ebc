/*
 * File: device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <concepts>
#include <stdexcept>
#include <string>

#include "nestrel/core/bytes.hpp"

namespace nestrel::storage {

    using position_type = std::uint64_t;

    class storage_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Byte-addressed backing medium of a file_table image.
    template <class D>
    concept RandomAccessDevice = requires(
        D dev,
        position_type off,
        nestrel::core::byte* dst,
        const nestrel::core::byte* src,
        std::size_t n
    ) {
        { dev.is_open() } -> std::convertible_to<bool>;

        { dev.read_at_offset(off, dst, n) }  -> std::same_as<bool>;
        { dev.write_at_offset(off, src, n) } -> std::same_as<bool>;

        { dev.get_file_size() } -> std::convertible_to<position_type>;
        { dev.flush() } -> std::same_as<bool>;
    };

} // namespace nestrel::storage
