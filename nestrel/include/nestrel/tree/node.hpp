/*
 * File: node.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace nestrel::tree {

    using bound_type = std::int64_t;

    enum class field {
        left,
        right,
    };

    // Any record with public `left` and `right` bounds can live in a tree.
    // Everything else (key, payload) belongs to the record type.
    template <typename T>
    concept TreeNode = requires(T n) {
        requires std::same_as<std::remove_cvref_t<decltype(n.left)>, bound_type>;
        requires std::same_as<std::remove_cvref_t<decltype(n.right)>, bound_type>;
    };

    struct interval {
        bound_type left = 0;
        bound_type right = 0;
        auto operator<=>(const interval&) const = default;
    };
    static_assert(TreeNode<interval>);

    template <TreeNode NodeT>
    constexpr interval interval_of(const NodeT& node) noexcept {
        return { node.left, node.right };
    }

    template <TreeNode NodeT>
    constexpr bound_type& bound_ref(NodeT& node, field f) noexcept {
        return (f == field::left) ? node.left : node.right;
    }

    template <TreeNode NodeT>
    constexpr bound_type bound_of(const NodeT& node, field f) noexcept {
        return (f == field::left) ? node.left : node.right;
    }

    // Number of interval slots a subtree occupies.
    template <TreeNode NodeT>
    constexpr bound_type width(const NodeT& node) noexcept {
        return node.right - node.left + 1;
    }

    template <TreeNode NodeT>
    constexpr bool has_children(const NodeT& node) noexcept {
        return node.right - node.left > 1;
    }

    template <TreeNode NodeT>
    constexpr bool is_leaf(const NodeT& node) noexcept {
        return node.right == node.left + 1;
    }

    // True for any descendant of `parent`, not only immediate children.
    template <TreeNode NodeT, TreeNode ParentT>
    constexpr bool is_child_of(const NodeT& node, const ParentT& parent) noexcept {
        return parent.left < node.left && node.right < parent.right;
    }

    template <TreeNode NodeT, TreeNode OtherT>
    constexpr bool same_interval(const NodeT& a, const OtherT& b) noexcept {
        return a.left == b.left && a.right == b.right;
    }

} // namespace nestrel::tree
