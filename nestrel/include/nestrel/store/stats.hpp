/*
 * File: stats.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-17
 * License: MIT
 */

 #pragma once
#include <cstdint>

namespace nestrel::store {

struct stats {
    std::uint64_t bulk_updates = 0, rows_shifted = 0;
    std::uint64_t rows_inserted = 0, rows_loaded = 0;
    std::uint64_t selects = 0;
    void reset() { *this = {}; }
};

template <typename T = std::uint64_t>
struct null_field {
    constexpr null_field& operator++() noexcept { return *this; }
    constexpr T operator++(int) noexcept { return T{}; }
    constexpr null_field& operator+=(T) noexcept { return *this; }
    constexpr null_field& operator=(T) noexcept { return *this; }
    constexpr operator T() const noexcept { return T{}; }
};

struct null_stats {
    null_field<> bulk_updates, rows_shifted;
    null_field<> rows_inserted, rows_loaded;
    null_field<> selects;
    void reset() {}
};

} // namespace nestrel::store
