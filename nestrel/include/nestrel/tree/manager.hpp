/*
 * File: manager.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-15
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "nestrel/core/debug.hpp"
#include "nestrel/tree/concepts.hpp"
#include "nestrel/tree/errors.hpp"
#include "nestrel/tree/node.hpp"
#include "nestrel/tree/policies.hpp"
#include "nestrel/tree/predicate.hpp"
#include "nestrel/tree/settings.hpp"
#include "nestrel/tree/validate.hpp"

namespace nestrel::tree {

    // Maintains nested-set bounds of the nodes kept in a store. The manager is
    // the only writer of `left`/`right`; every mutation validates its
    // arguments first and then renumbers through shift().
    template <concepts::NodeStore StoreT>
    class manager {

    public:
        using store_type = StoreT;
        using node_type = typename StoreT::node_type;
        using node_list = std::vector<node_type*>;

        explicit manager(store_type& store, settings s = {})
            : store_(store)
            , settings_(s)
        {}

        // Appends `entity` as the last child of `parent`, or as the last root
        // when `parent` is null. Returns the entity now tracked by the store.
        node_type& add_child(node_type entity, const node_type* parent) {
            if (parent != nullptr) {
                check_attached(*parent, "parent");
            }
            node_type* added = nullptr;
            run_mutation([&]() {
                bound_type position = 0;
                if (parent != nullptr) {
                    position = shift_from_position(parent->right, 2);
                }
                else {
                    position = store_.max(field::right).value_or(0) + 1;
                }
                entity.left = position;
                entity.right = position + 1;
                added = &store_.add(std::move(entity));
            });
            return *added;
        }

        node_type& add_child(node_type entity, const node_type& parent) {
            return add_child(std::move(entity), &parent);
        }

        node_type& add_root(node_type entity) {
            return add_child(std::move(entity), nullptr);
        }

        // Places `entity` right before `sibling`, under the same parent.
        node_type& insert_before(node_type entity, const node_type& sibling) {
            check_attached(sibling, "sibling");
            node_type* added = nullptr;
            run_mutation([&]() {
                const auto position = shift_from_position(sibling.left, 2);
                entity.left = position;
                entity.right = position + 1;
                added = &store_.add(std::move(entity));
            });
            return *added;
        }

        // Makes the subtree of `source` the last child of `target`.
        void move(const node_type& source, const node_type& target) {
            check_attached(source, "source");
            check_attached(target, "target");
            if (&source == &target || same_interval(source, target) || is_child_of(target, source)) {
                throw illegal_relocation_error("can not move a node under itself or its own descendant");
            }
            relocate(source, target.right);
        }

        // Makes the subtree of `source` the preceding sibling of `sibling`.
        void move_before(const node_type& source, const node_type& sibling) {
            check_attached(source, "source");
            check_attached(sibling, "sibling");
            if (&source == &sibling || same_interval(source, sibling) || is_child_of(sibling, source)) {
                throw illegal_relocation_error("can not move a node next to itself or its own descendant");
            }
            relocate(source, sibling.left);
        }

        // Makes the subtree of `source` the last root.
        void move_to_root(const node_type& source) {
            check_attached(source, "source");
            const auto max_right = store_.max(field::right).value_or(source.right);
            relocate(source, max_right + 1);
        }

        // Every node strictly inside `node`, in document order.
        node_list all_descendants(const node_type& node) {
            return store_.range_query(predicate::strictly_inside(node.left, node.right));
        }

        // Immediate children of `node`, in sibling order.
        node_list direct_children(const node_type& node) {
            return walk_chain(node.left + 1, node.right);
        }

        node_list roots() {
            auto first = store_.min(field::left);
            if (!first) {
                return {};
            }
            return walk_chain(*first, std::nullopt);
        }

        validation_report check() {
            return tree::validate(store_.read_all());
        }

        template <concepts::Labeler<node_type> LabelT>
        void dump(std::ostream& os, const LabelT& label) {
            auto all = store_.read_all();
            if (all.empty()) {
                os << "<Empty>\n";
                return;
            }
            std::vector<bound_type> open;
            for (auto* node : all) {
                while (!open.empty() && open.back() < node->left) {
                    open.pop_back();
                }
                os << std::string(open.size() * 2, ' ')
                   << std::format("{} [{}, {}]\n", std::string(label(*node)), node->left, node->right);
                open.push_back(node->right);
            }
        }

        void dump(std::ostream& os) {
            dump(os, [](const node_type&) { return std::string("*"); });
        }

        void set_gap_policy(policies::gap gp) {
            settings_.gap_policy = gp;
        }

        const settings& get_settings() const noexcept {
            return settings_;
        }

        store_type& get_store() noexcept {
            return store_;
        }

    NESTREL_PRIVATE_TESTABLE:

        // Adds `offset` to every left in [from, to) and then to every right in
        // [from, to). A missing bound is open on that side.
        std::size_t shift(bound_type offset, std::optional<bound_type> from, std::optional<bound_type> to) {
            const range r{ from, to };
            if (!r.is_bounded()) {
                throw malformed_shift_error{};
            }
            std::size_t touched = 0;
            touched += store_.bulk_update(predicate::on(field::left, r), field::left, offset);
            touched += store_.bulk_update(predicate::on(field::right, r), field::right, offset);
            return touched;
        }

        // Opens `gap` free slots at `position`, renumbering the smaller side
        // unless the policy says otherwise. Returns the first free slot.
        bound_type shift_from_position(bound_type position, bound_type gap) {
            NESTREL_ASSERT(gap > 0, "gap must be positive");
            if (shifts_backward(position)) {
                shift(-gap, std::nullopt, position);
                return position - gap;
            }
            shift(gap, position, std::nullopt);
            return position;
        }

    private:

        bool shifts_backward(bound_type position) const {
            switch (settings_.gap_policy) {
            case policies::gap::forward:
                return false;
            case policies::gap::backward:
                return true;
            case policies::gap::cheapest:
                break;
            }
            const auto lowest = store_.min(field::left).value_or(position);
            const auto highest = store_.max(field::right).value_or(position);
            return position - lowest <= highest - position;
        }

        // Moves the subtree of `source` so that it starts where `destination`
        // is now (destination lies outside the subtree):
        //   A: park the subtree below the lowest bound of the tree,
        //   B: slide the nodes between the old and new place over the hole,
        //   C: drop the parked subtree into the freed slots.
        void relocate(const node_type& source, bound_type destination) {
            const auto left = source.left;
            const auto right = source.right;
            const auto w = right - left + 1;
            const auto p = right + 1;
            NESTREL_ASSERT(destination <= left || destination > right, "destination inside the moved subtree");

            run_mutation([&]() {
                const auto lowest = store_.min(field::left).value_or(left);
                const auto parked = lowest - w;

                shift(-(p - lowest), left, p);
                if (destination > right) {
                    shift(-w, p, destination);
                    shift(destination - lowest, parked, lowest);
                }
                else {
                    shift(w, destination, left);
                    shift(destination - lowest + w, parked, lowest);
                }
            });
        }

        node_list walk_chain(bound_type start, std::optional<bound_type> limit) {
            node_list chain;
            auto next = start;
            while (!limit || next < *limit) {
                auto found = store_.range_query(predicate::on(field::left, range::exactly(next)));
                if (found.empty()) {
                    break;
                }
                chain.push_back(found.front());
                next = found.front()->right + 1;
            }
            return chain;
        }

        void check_attached(const node_type& node, const char* role) const {
            if (!store_.is_attached(node)) {
                throw detached_reference_error(role);
            }
        }

        // Runs `body` atomically when the store has transactions. With
        // verify_mutations the result is checked before it is committed.
        template <typename BodyT>
        void run_mutation(BodyT&& body) {
            if constexpr (concepts::TransactionalStore<store_type>) {
                auto tx = store_.begin_transaction();
                body();
                verify();
                tx.commit();
            }
            else {
                body();
                verify();
            }
        }

        void verify() {
            if (!settings_.verify_mutations) {
                return;
            }
            auto report = check();
            if (!report.ok()) {
                throw tree_error(std::format("tree invariants violated: {}", report.problems.front()));
            }
        }

        store_type& store_;
        settings settings_;
    };

} // namespace nestrel::tree
