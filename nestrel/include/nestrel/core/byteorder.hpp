/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <type_traits>

#include "nestrel/core/bytes.hpp"

namespace nestrel::core::byteorder {

    template <typename T>
    concept UnsignedWord = std::is_unsigned_v<T> &&
        ((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

    template <typename T>
    concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
        ((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

    template <typename T>
    concept Word = SignedWord<T> || UnsignedWord<T>;

    // Records on disk are always little-endian.
    template <UnsignedWord WordT>
    constexpr inline WordT le_to_native_unsigned(const core::byte* mem) {
        if constexpr (std::endian::native != std::endian::little) {
            WordT result = 0;
            for (std::size_t i = 0; i < sizeof(WordT); ++i) {
                result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (8 * i));
            }
            return result;
        }
        else {
            WordT result;
            std::memcpy(&result, mem, sizeof(WordT));
            return result;
        }
    }

    template <UnsignedWord WordT>
    constexpr inline void native_to_le_unsigned(WordT val, core::byte* mem) {
        if constexpr (std::endian::native != std::endian::little) {
            for (std::size_t i = 0; i < sizeof(WordT); ++i) {
                mem[i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
            }
        }
        else {
            std::memcpy(mem, &val, sizeof(WordT));
        }
    }

    template <Word WordT>
    constexpr inline WordT le_to_native(const core::byte* mem) {
        if constexpr (SignedWord<WordT>) {
            using unsigned_type = std::make_unsigned_t<WordT>;
            return static_cast<WordT>(le_to_native_unsigned<unsigned_type>(mem));
        }
        else {
            return le_to_native_unsigned<WordT>(mem);
        }
    }

    template <Word WordT>
    constexpr inline void native_to_le(WordT val, core::byte* mem) {
        if constexpr (SignedWord<WordT>) {
            using unsigned_type = std::make_unsigned_t<WordT>;
            native_to_le_unsigned<unsigned_type>(static_cast<unsigned_type>(val), mem);
        }
        else {
            native_to_le_unsigned<WordT>(val, mem);
        }
    }

} // namespace nestrel::core::byteorder
