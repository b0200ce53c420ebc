/*
 * File: memory_table.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-17
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "nestrel/tree/node.hpp"
#include "nestrel/tree/predicate.hpp"
#include "nestrel/store/table/concepts.hpp"

namespace nestrel::store::table {

    // Rows keyed by an increasing integer. Transactions are flat: begin()
    // nests by counting, the outermost commit() drops the undo image and any
    // rollback() restores the image taken by the outermost begin().
    template <tree::TreeNode RowT>
    class memory_table {
    public:
        using row_type = RowT;
        using key_type = std::uint64_t;
        using rows_type = std::map<key_type, row_type>;

        std::vector<std::pair<key_type, row_type>> select(const tree::predicate& where) const {
            std::vector<std::pair<key_type, row_type>> result;
            for (const auto& [key, row] : rows_) {
                if (where(row)) {
                    result.emplace_back(key, row);
                }
            }
            return result;
        }

        std::optional<row_type> load(key_type key) const {
            auto itr = rows_.find(key);
            if (itr != rows_.end()) {
                return itr->second;
            }
            return std::nullopt;
        }

        std::size_t update_where(const tree::predicate& where, tree::field f, tree::bound_type delta) {
            std::size_t touched = 0;
            for (auto& [key, row] : rows_) {
                if (where(row)) {
                    tree::bound_ref(row, f) += delta;
                    ++touched;
                }
            }
            return touched;
        }

        key_type insert(const row_type& row) {
            const auto key = next_key_++;
            rows_.emplace(key, row);
            return key;
        }

        // Places a row under a known key, used when loading a persisted image.
        void put(key_type key, row_type row) {
            rows_.insert_or_assign(key, std::move(row));
            if (key >= next_key_) {
                next_key_ = key + 1;
            }
        }

        void advance_key(key_type next) {
            if (next > next_key_) {
                next_key_ = next;
            }
        }

        std::optional<tree::bound_type> min(tree::field f) const {
            std::optional<tree::bound_type> result;
            for (const auto& [key, row] : rows_) {
                const auto v = tree::bound_of(row, f);
                if (!result || v < *result) {
                    result = v;
                }
            }
            return result;
        }

        std::optional<tree::bound_type> max(tree::field f) const {
            std::optional<tree::bound_type> result;
            for (const auto& [key, row] : rows_) {
                const auto v = tree::bound_of(row, f);
                if (!result || v > *result) {
                    result = v;
                }
            }
            return result;
        }

        std::size_t size() const noexcept {
            return rows_.size();
        }

        const rows_type& rows() const noexcept {
            return rows_;
        }

        key_type next_key() const noexcept {
            return next_key_;
        }

        void begin() {
            if (depth_++ == 0) {
                undo_.emplace(image{ rows_, next_key_ });
            }
        }

        void commit() {
            if (depth_ == 0) {
                return;
            }
            if (--depth_ == 0) {
                undo_.reset();
            }
        }

        void rollback() {
            if (depth_ == 0) {
                return;
            }
            rows_ = std::move(undo_->rows);
            next_key_ = undo_->next_key;
            undo_.reset();
            depth_ = 0;
        }

        bool in_transaction() const noexcept {
            return depth_ > 0;
        }

        std::size_t depth() const noexcept {
            return depth_;
        }

    private:
        struct image {
            rows_type rows;
            key_type next_key;
        };

        rows_type rows_;
        key_type next_key_ = 1;
        std::optional<image> undo_;
        std::size_t depth_ = 0;
    };
    static_assert(concepts::DurableTable<memory_table<tree::interval>>);

} // namespace nestrel::store::table
