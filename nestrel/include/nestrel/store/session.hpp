/*
 * File: session.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-18
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "nestrel/core/assert.hpp"
#include "nestrel/tree/node.hpp"
#include "nestrel/tree/predicate.hpp"
#include "nestrel/store/stats.hpp"
#include "nestrel/store/table/concepts.hpp"

namespace nestrel::store {

    enum class entity_state {
        added,
        unchanged,
    };

    // Unit of work over a durable table.
    //
    // Entities handed out by the session live as long as the session. Staged
    // entities (add) exist only here until save_changes(); rows read from the
    // table are tracked by key, so one row is always one entity. Bulk updates
    // go to the table and to every tracked entity with the same predicate.
    template <table::concepts::DurableTable TableT, typename StatsT = null_stats>
    class session {

        struct entry {
            typename TableT::row_type node;
            entity_state state = entity_state::added;
            std::optional<typename TableT::key_type> key;
        };

        struct saved_entry {
            tree::interval bounds;
            entity_state state;
            std::optional<typename TableT::key_type> key;
        };

    public:
        using table_type = TableT;
        using node_type = typename TableT::row_type;
        using key_type = typename TableT::key_type;
        using stats_type = StatsT;

        class transaction {
        public:
            transaction() = default;

            explicit transaction(session& owner)
                : owner_(&owner)
            {
                owner_->begin_();
            }

            transaction(transaction&& other) noexcept
                : owner_(std::exchange(other.owner_, nullptr))
            {}

            transaction& operator = (transaction&& other) noexcept {
                if (this != &other) {
                    rollback();
                    owner_ = std::exchange(other.owner_, nullptr);
                }
                return *this;
            }

            transaction(const transaction&) = delete;
            transaction& operator = (const transaction&) = delete;

            ~transaction() {
                rollback();
            }

            void commit() {
                if (owner_) {
                    owner_->commit_();
                    owner_ = nullptr;
                }
            }

            void rollback() noexcept {
                if (owner_) {
                    owner_->rollback_();
                    owner_ = nullptr;
                }
            }

            bool is_active() const noexcept {
                return owner_ != nullptr;
            }

        private:
            session* owner_ = nullptr;
        };

        explicit session(table_type& table)
            : table_(table)
        {}

        session(const session&) = delete;
        session& operator = (const session&) = delete;

        node_type& add(node_type node) {
            auto& e = make_entry(std::move(node), entity_state::added, std::nullopt);
            return e.node;
        }

        bool is_attached(const node_type& node) const {
            return index_.contains(&node);
        }

        std::optional<entity_state> state_of(const node_type& node) const {
            auto itr = index_.find(&node);
            if (itr != index_.end()) {
                return itr->second->state;
            }
            return std::nullopt;
        }

        std::optional<key_type> key_of(const node_type& node) const {
            auto itr = index_.find(&node);
            if (itr != index_.end()) {
                return itr->second->key;
            }
            return std::nullopt;
        }

        std::vector<node_type*> read_all() {
            return range_query(tree::predicate{});
        }

        // Durable rows and staged entities matching `where`, ordered by left.
        std::vector<node_type*> range_query(const tree::predicate& where) {
            ++stats_.selects;
            std::vector<node_type*> result;
            for (auto& [key, row] : table_.select(where)) {
                result.push_back(&track(key, std::move(row)));
            }
            for (auto& e : entries_) {
                if (e->state == entity_state::added && where(e->node)) {
                    result.push_back(&e->node);
                }
            }
            std::ranges::sort(result, {}, [](const node_type* n) { return n->left; });
            return result;
        }

        node_type* find(key_type key) {
            auto itr = by_key_.find(key);
            if (itr != by_key_.end()) {
                return &itr->second->node;
            }
            if (auto row = table_.load(key)) {
                return &track(key, std::move(*row));
            }
            return nullptr;
        }

        template <typename PredT>
        node_type* find_if(PredT&& pred) {
            for (auto* node : read_all()) {
                if (pred(*node)) {
                    return node;
                }
            }
            return nullptr;
        }

        std::optional<tree::bound_type> min(tree::field f) const {
            auto result = table_.min(f);
            for (const auto& e : entries_) {
                if (e->state == entity_state::added) {
                    const auto v = tree::bound_of(e->node, f);
                    if (!result || v < *result) {
                        result = v;
                    }
                }
            }
            return result;
        }

        std::optional<tree::bound_type> max(tree::field f) const {
            auto result = table_.max(f);
            for (const auto& e : entries_) {
                if (e->state == entity_state::added) {
                    const auto v = tree::bound_of(e->node, f);
                    if (!result || v > *result) {
                        result = v;
                    }
                }
            }
            return result;
        }

        // Adds `delta` to the chosen bound of every durable row and tracked
        // entity matching `where`. Returns the number of bounds changed.
        std::size_t bulk_update(const tree::predicate& where, tree::field f, tree::bound_type delta) {
            ++stats_.bulk_updates;
            std::size_t touched = table_.update_where(where, f, delta);
            for (auto& e : entries_) {
                if (where(e->node)) {
                    tree::bound_ref(e->node, f) += delta;
                    if (e->state == entity_state::added) {
                        ++touched;
                    }
                }
            }
            stats_.rows_shifted += touched;
            return touched;
        }

        // Inserts every staged entity into the table. Returns how many.
        std::size_t save_changes() {
            std::vector<std::pair<entry*, key_type>> inserted;
            auto tx = begin_transaction();
            for (auto& e : entries_) {
                if (e->state == entity_state::added) {
                    inserted.emplace_back(e.get(), table_.insert(e->node));
                }
            }
            for (auto& [e, key] : inserted) {
                e->state = entity_state::unchanged;
                e->key = key;
                by_key_.emplace(key, e);
            }
            tx.commit();
            stats_.rows_inserted += inserted.size();
            return inserted.size();
        }

        std::size_t pending() const {
            return static_cast<std::size_t>(std::ranges::count_if(entries_,
                [](const auto& e) { return e->state == entity_state::added; }));
        }

        std::size_t tracked() const noexcept {
            return entries_.size();
        }

        transaction begin_transaction() {
            return transaction(*this);
        }

        table_type& get_table() noexcept {
            return table_;
        }

        stats_type& get_stats() noexcept {
            return stats_;
        }

    private:

        entry& make_entry(node_type node, entity_state state, std::optional<key_type> key) {
            auto e = std::make_unique<entry>(entry{ std::move(node), state, key });
            auto* raw = e.get();
            index_.emplace(&raw->node, raw);
            if (key) {
                by_key_.emplace(*key, raw);
            }
            entries_.push_back(std::move(e));
            return *raw;
        }

        node_type& track(key_type key, node_type row) {
            auto itr = by_key_.find(key);
            if (itr != by_key_.end()) {
                return itr->second->node;
            }
            ++stats_.rows_loaded;
            return make_entry(std::move(row), entity_state::unchanged, key).node;
        }

        void begin_() {
            table_.begin();
            if (depth_++ == 0) {
                saved_.clear();
                saved_.reserve(entries_.size());
                for (const auto& e : entries_) {
                    saved_.push_back({ tree::interval_of(e->node), e->state, e->key });
                }
                saved_by_key_ = by_key_;
            }
        }

        void commit_() {
            if (depth_ == 0) {
                return;
            }
            table_.commit();
            if (--depth_ == 0) {
                saved_.clear();
                saved_by_key_.clear();
            }
        }

        // Entities created after the outermost begin are discarded and the
        // key map taken at begin is swapped back in.
        void rollback_() noexcept {
            if (depth_ == 0) {
                return;
            }
            table_.rollback();
            depth_ = 0;

            NESTREL_ASSERT(saved_.size() <= entries_.size(), "tracked entities cannot shrink inside a transaction");
            for (std::size_t i = saved_.size(); i < entries_.size(); ++i) {
                index_.erase(&entries_[i]->node);
            }
            entries_.resize(saved_.size());

            for (std::size_t i = 0; i < entries_.size(); ++i) {
                auto& e = *entries_[i];
                e.node.left = saved_[i].bounds.left;
                e.node.right = saved_[i].bounds.right;
                e.state = saved_[i].state;
                e.key = saved_[i].key;
            }
            by_key_.swap(saved_by_key_);
            saved_by_key_.clear();
            saved_.clear();
        }

        table_type& table_;
        stats_type stats_{};
        std::vector<std::unique_ptr<entry>> entries_;
        std::unordered_map<const node_type*, entry*> index_;
        std::map<key_type, entry*> by_key_;
        std::vector<saved_entry> saved_;
        std::map<key_type, entry*> saved_by_key_;
        std::size_t depth_ = 0;
    };

} // namespace nestrel::store
