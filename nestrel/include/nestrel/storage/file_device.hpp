/*
 * File: file_device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <fstream>
#include <filesystem>
#include <utility>

#include "nestrel/core/bytes.hpp"
#include "nestrel/storage/device.hpp"

namespace nestrel::storage {

// Table image file. Created empty when missing (not thread-safe).
class file_device {
public:
    using position_type = storage::position_type;

    file_device() = default;

    explicit file_device(std::filesystem::path filename)
        : path_(std::move(filename)) {
        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        if (!file_.is_open()) {
            std::ofstream{ path_, std::ios::binary };
            file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        }
    }

    bool is_open() const noexcept {
        return file_.is_open();
    }

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    bool write_at_offset(position_type offset, const core::byte* src, std::size_t n) {
        if (!seek_(offset)) {
            return false;
        }
        file_.write(reinterpret_cast<const char*>(src), static_cast<std::streamsize>(n));
        return file_.good();
    }

    bool read_at_offset(position_type offset, core::byte* dst, std::size_t n) {
        if (!seek_(offset)) {
            return false;
        }
        file_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
        return file_.gcount() == static_cast<std::streamsize>(n);
    }

    bool flush() {
        return is_open() && file_.flush().good();
    }

    position_type get_file_size() {
        if (!is_open()) {
            return 0;
        }
        file_.clear();
        const auto end = file_.seekg(0, std::ios::end).tellg();
        return end < 0 ? 0 : static_cast<position_type>(end);
    }

private:

    bool seek_(position_type offset) {
        if (!is_open()) {
            return false;
        }
        file_.clear();
        const auto pos = static_cast<std::streamoff>(offset);
        file_.seekg(pos, std::ios::beg);
        file_.seekp(pos, std::ios::beg);
        return file_.good();
    }

    std::filesystem::path path_{};
    std::fstream file_{};
};

static_assert(RandomAccessDevice<file_device>);

} // namespace nestrel::storage
