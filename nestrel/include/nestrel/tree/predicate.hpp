/*
 * File: predicate.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include <optional>

#include "nestrel/tree/node.hpp"

namespace nestrel::tree {

    // Half-open [from, to); a missing side is unbounded.
    struct range {
        std::optional<bound_type> from;
        std::optional<bound_type> to;

        static range between(bound_type from, bound_type to) {
            return { from, to };
        }

        static range at_least(bound_type from) {
            return { from, std::nullopt };
        }

        static range below(bound_type to) {
            return { std::nullopt, to };
        }

        static range exactly(bound_type value) {
            return { value, value + 1 };
        }

        bool is_bounded() const noexcept {
            return from.has_value() || to.has_value();
        }

        bool is_empty() const noexcept {
            return from && to && *from >= *to;
        }

        bool contains(bound_type value) const noexcept {
            return (!from || *from <= value) && (!to || value < *to);
        }
    };

    // Conjunction of optional ranges over the two bounds of a node.
    class predicate {
    public:

        predicate() = default;

        static predicate on(field f, range r) {
            predicate p;
            return p.and_on(f, r);
        }

        static predicate strictly_inside(bound_type left, bound_type right) {
            return predicate::on(field::left, range::at_least(left + 1))
                .and_on(field::right, range::below(right));
        }

        predicate& and_on(field f, range r) {
            if (f == field::left) {
                left_ = r;
            }
            else {
                right_ = r;
            }
            return *this;
        }

        const std::optional<range>& left() const noexcept {
            return left_;
        }

        const std::optional<range>& right() const noexcept {
            return right_;
        }

        bool matches(bound_type left, bound_type right) const noexcept {
            return (!left_ || left_->contains(left)) && (!right_ || right_->contains(right));
        }

        template <TreeNode NodeT>
        bool operator()(const NodeT& node) const noexcept {
            return matches(node.left, node.right);
        }

    private:
        std::optional<range> left_;
        std::optional<range> right_;
    };

} // namespace nestrel::tree
