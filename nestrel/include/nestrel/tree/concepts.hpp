/*
 * File: concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nestrel/tree/node.hpp"
#include "nestrel/tree/predicate.hpp"

namespace nestrel::tree::concepts {

    // What tree::manager needs from the storage side. Results are pointers to
    // entities the store keeps alive and tracks, so shifts reach them too.
    template <typename StoreT>
    concept NodeStore = requires(StoreT s, const StoreT cs,
                                 typename StoreT::node_type node,
                                 const typename StoreT::node_type& cnode,
                                 const predicate& where, field f, bound_type delta) {

        typename StoreT::node_type;
        requires TreeNode<typename StoreT::node_type>;

        // Read
        { s.read_all() } -> std::same_as<std::vector<typename StoreT::node_type*>>;
        { s.range_query(where) } -> std::same_as<std::vector<typename StoreT::node_type*>>;
        { cs.min(f) } -> std::same_as<std::optional<bound_type>>;
        { cs.max(f) } -> std::same_as<std::optional<bound_type>>;

        // Write: returns the number of bounds touched
        { s.bulk_update(where, f, delta) } -> std::convertible_to<std::size_t>;

        // Stage
        { s.add(std::move(node)) } -> std::same_as<typename StoreT::node_type&>;
        { cs.is_attached(cnode) } -> std::convertible_to<bool>;
    };

    template <typename StoreT>
    concept TransactionalStore = NodeStore<StoreT> && requires(StoreT s) {
        typename StoreT::transaction;
        { s.begin_transaction() } -> std::same_as<typename StoreT::transaction>;
        requires requires(typename StoreT::transaction tx) {
            { tx.commit() } -> std::same_as<void>;
        };
    };

    template <typename F, typename NodeT>
    concept Labeler = requires(const F & f, const NodeT & node) {
        { f(node) } -> std::convertible_to<std::string>;
    };

} // namespace nestrel::tree::concepts
