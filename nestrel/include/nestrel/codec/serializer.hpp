/*
 * File: serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <cstring>
#include <string>
#include <tuple>

#include "nestrel/core/bytes.hpp"
#include "nestrel/core/byteorder.hpp"

namespace nestrel::codec {

    namespace byteorder = core::byteorder;

    // Specialize for row types stored by store::table::file_table.
    // load() reports 0 consumed bytes when the input is too short.
    template <typename T>
    struct serializer;

    template <byteorder::Word WordT>
    struct integer_serializer {

        using value_type = WordT;

        constexpr static std::size_t store(value_type val, core::byte* where) {
            byteorder::native_to_le<value_type>(val, where);
            return sizeof(value_type);
        }

        constexpr static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t available) {
            if (available < sizeof(value_type)) {
                return { value_type{}, 0 };
            }
            return { byteorder::le_to_native<value_type>(where), sizeof(value_type) };
        }

        constexpr static std::size_t size(const value_type&) {
            return sizeof(value_type);
        }
    };

    template <>
    struct serializer<std::int32_t> : public integer_serializer<std::int32_t> {};
    template <>
    struct serializer<std::int64_t> : public integer_serializer<std::int64_t> {};

    template <>
    struct serializer<std::uint16_t> : public integer_serializer<std::uint16_t> {};
    template <>
    struct serializer<std::uint32_t> : public integer_serializer<std::uint32_t> {};
    template <>
    struct serializer<std::uint64_t> : public integer_serializer<std::uint64_t> {};

    // u32 length prefix followed by the characters
    template <>
    struct serializer<std::string> {

        using value_type = std::string;
        using length_serializer = serializer<std::uint32_t>;

        static std::size_t store(const value_type& val, core::byte* where) {
            const auto shift = length_serializer::store(static_cast<std::uint32_t>(val.size()), where);
            std::memcpy(where + shift, val.data(), val.size());
            return shift + val.size();
        }

        static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t available) {
            auto [length, shift] = length_serializer::load(where, available);
            if (shift == 0 || available - shift < length) {
                return { value_type{}, 0 };
            }
            value_type val(reinterpret_cast<const char*>(where + shift), length);
            return { std::move(val), shift + length };
        }

        static std::size_t size(const value_type& val) {
            return sizeof(std::uint32_t) + val.size();
        }
    };

    template <typename T>
    concept Serializable = requires(const T & val, core::byte* out, const core::byte* in, std::size_t n) {
        { serializer<T>::store(val, out) } -> std::convertible_to<std::size_t>;
        { serializer<T>::load(in, n) } -> std::same_as<std::tuple<T, std::size_t>>;
        { serializer<T>::size(val) } -> std::convertible_to<std::size_t>;
    };

    template <Serializable T>
    std::size_t append(core::byte_buffer& out, const T& val) {
        const auto offset = out.size();
        out.resize(offset + serializer<T>::size(val));
        return serializer<T>::store(val, out.data() + offset);
    }

} // namespace nestrel::codec
