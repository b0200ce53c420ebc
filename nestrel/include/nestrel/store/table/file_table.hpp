/*
 * File: file_table.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-18
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <utility>
#include <vector>

#include "nestrel/core/bytes.hpp"
#include "nestrel/codec/serializer.hpp"
#include "nestrel/storage/device.hpp"
#include "nestrel/store/table/concepts.hpp"
#include "nestrel/store/table/memory_table.hpp"

namespace nestrel::store::table {

    // A memory_table image persisted to a device.
    //
    // Layout (little-endian):
    //   header : magic u32, version u16, next_key u64, count u64
    //   record : key u64, length u32, row bytes (codec::serializer<RowT>)
    //
    // The image is written when the outermost transaction commits, or right
    // after each statement when no transaction is open.
    template <tree::TreeNode RowT, storage::RandomAccessDevice DeviceT>
        requires codec::Serializable<RowT>
    class file_table {
    public:
        using row_type = RowT;
        using device_type = DeviceT;
        using image_type = memory_table<RowT>;
        using key_type = typename image_type::key_type;

        constexpr static std::uint32_t magic_value = 0x5254534E; // "NSTR"
        constexpr static std::uint16_t version_value = 1;
        constexpr static std::size_t header_size = sizeof(std::uint32_t) + sizeof(std::uint16_t)
            + sizeof(std::uint64_t) + sizeof(std::uint64_t);

        explicit file_table(device_type& device)
            : device_(device)
        {
            if (!device_.is_open()) {
                throw storage::storage_error("table device is not open");
            }
            if (device_.get_file_size() == 0) {
                persist();
            }
            else {
                load_image();
            }
        }

        std::vector<std::pair<key_type, row_type>> select(const tree::predicate& where) const {
            return image_.select(where);
        }

        std::optional<row_type> load(key_type key) const {
            return image_.load(key);
        }

        std::size_t update_where(const tree::predicate& where, tree::field f, tree::bound_type delta) {
            const auto touched = image_.update_where(where, f, delta);
            if (touched > 0) {
                autocommit();
            }
            return touched;
        }

        key_type insert(const row_type& row) {
            const auto key = image_.insert(row);
            autocommit();
            return key;
        }

        std::optional<tree::bound_type> min(tree::field f) const {
            return image_.min(f);
        }

        std::optional<tree::bound_type> max(tree::field f) const {
            return image_.max(f);
        }

        std::size_t size() const noexcept {
            return image_.size();
        }

        const image_type& image() const noexcept {
            return image_;
        }

        void begin() {
            image_.begin();
        }

        // A failed write leaves the transaction open for rollback().
        void commit() {
            if (image_.depth() == 1) {
                persist();
            }
            image_.commit();
        }

        void rollback() {
            image_.rollback();
        }

        // Writes the current image regardless of open transactions.
        void persist() {
            core::byte_buffer buf;
            buf.reserve(header_size);
            codec::append(buf, magic_value);
            codec::append(buf, version_value);
            codec::append(buf, static_cast<std::uint64_t>(image_.next_key()));
            codec::append(buf, static_cast<std::uint64_t>(image_.size()));

            for (const auto& [key, row] : image_.rows()) {
                codec::append(buf, static_cast<std::uint64_t>(key));
                codec::append(buf, static_cast<std::uint32_t>(codec::serializer<row_type>::size(row)));
                codec::append(buf, row);
            }

            if (!device_.write_at_offset(0, buf.data(), buf.size()) || !device_.flush()) {
                throw storage::storage_error(std::format("failed to write table image ({} bytes)", buf.size()));
            }
        }

    private:

        void autocommit() {
            if (!image_.in_transaction()) {
                persist();
            }
        }

        void load_image() {
            const auto total = static_cast<std::size_t>(device_.get_file_size());
            if (total < header_size) {
                throw storage::storage_error(std::format("table image is truncated: {} bytes", total));
            }
            core::byte_buffer buf(total);
            if (!device_.read_at_offset(0, buf.data(), buf.size())) {
                throw storage::storage_error("failed to read table image");
            }

            std::size_t offset = 0;
            const auto magic = take<std::uint32_t>(buf, offset);
            const auto version = take<std::uint16_t>(buf, offset);
            if (magic != magic_value) {
                throw storage::storage_error(std::format("bad table magic {:#x}", magic));
            }
            if (version != version_value) {
                throw storage::storage_error(std::format("unsupported table version {}", version));
            }
            const auto next_key = take<std::uint64_t>(buf, offset);
            const auto count = take<std::uint64_t>(buf, offset);

            image_type loaded;
            for (std::uint64_t i = 0; i < count; ++i) {
                const auto key = take<std::uint64_t>(buf, offset);
                const auto length = take<std::uint32_t>(buf, offset);
                if (buf.size() - offset < length) {
                    throw storage::storage_error(std::format("record {} is truncated", key));
                }
                auto [row, used] = codec::serializer<row_type>::load(buf.data() + offset, length);
                if (used != length) {
                    throw storage::storage_error(std::format("record {} is corrupted", key));
                }
                offset += used;
                loaded.put(key, std::move(row));
            }
            if (loaded.next_key() > next_key) {
                throw storage::storage_error(std::format("next key {} is behind stored keys", next_key));
            }
            loaded.advance_key(next_key);
            image_ = std::move(loaded);
        }

        template <typename T>
        static T take(const core::byte_buffer& buf, std::size_t& offset) {
            auto [value, used] = codec::serializer<T>::load(buf.data() + offset, buf.size() - offset);
            if (used == 0) {
                throw storage::storage_error(std::format("table image is corrupted at offset {}", offset));
            }
            offset += used;
            return value;
        }

        device_type& device_;
        image_type image_;
    };

} // namespace nestrel::store::table
