/*
 * File: concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-17
 * License: MIT
 */

#pragma once
#include <concepts>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "nestrel/tree/node.hpp"
#include "nestrel/tree/predicate.hpp"

namespace nestrel::store::table::concepts {

    // The durable tier behind store::session.
    template <typename T>
    concept DurableTable = requires(T t, const T ct,
                                    const typename T::row_type& row,
                                    typename T::key_type key,
                                    const tree::predicate& where,
                                    tree::field f, tree::bound_type delta) {

        typename T::row_type;
        typename T::key_type;
        requires tree::TreeNode<typename T::row_type>;
        requires std::totally_ordered<typename T::key_type>;

        { ct.select(where) } -> std::same_as<std::vector<std::pair<typename T::key_type, typename T::row_type>>>;
        { ct.load(key) } -> std::same_as<std::optional<typename T::row_type>>;
        { ct.min(f) } -> std::same_as<std::optional<tree::bound_type>>;
        { ct.max(f) } -> std::same_as<std::optional<tree::bound_type>>;
        { ct.size() } -> std::convertible_to<std::size_t>;

        { t.update_where(where, f, delta) } -> std::convertible_to<std::size_t>;
        { t.insert(row) } -> std::same_as<typename T::key_type>;

        { t.begin() } -> std::same_as<void>;
        { t.commit() } -> std::same_as<void>;
        { t.rollback() } -> std::same_as<void>;
    };

} // namespace nestrel::store::table::concepts
