/*
 * File: memory_device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-15
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <cstring>
#include <vector>

#include "nestrel/core/bytes.hpp"
#include "nestrel/storage/device.hpp"

namespace nestrel::storage {

    class memory_device {
    public:
        using position_type = storage::position_type;

        bool is_open() const noexcept { return true; }

        position_type get_file_size() const noexcept {
            return data_.size();
        }

        bool read_at_offset(position_type off, core::byte* dst, std::size_t n) {
            if (off + n > data_.size()) {
                return false;
            }
            std::memcpy(dst, data_.data() + off, n);
            return true;
        }

        bool write_at_offset(position_type off, const core::byte* src, std::size_t n) {
            if (off + n > data_.size()) {
                data_.resize(off + n);
            }
            std::memcpy(data_.data() + off, src, n);
            ++writes_;
            return true;
        }

        bool flush() noexcept {
            return true;
        }

        std::size_t writes() const noexcept {
            return writes_;
        }

        core::byte_buffer& data() noexcept {
            return data_;
        }

    private:
        core::byte_buffer data_;
        std::size_t writes_ = 0;
    };
    static_assert(RandomAccessDevice<memory_device>);
}
