/*
 * File: validate.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-16
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <format>
#include <ranges>
#include <string>
#include <vector>

#include "nestrel/tree/node.hpp"

namespace nestrel::tree {

    struct validation_report {
        std::vector<std::string> problems;

        bool ok() const noexcept {
            return problems.empty();
        }

        explicit operator bool() const noexcept {
            return ok();
        }
    };

    namespace detail {

        template <TreeNode NodeT>
        const NodeT& as_node(const NodeT& node) noexcept {
            return node;
        }

        template <TreeNode NodeT>
        const NodeT& as_node(const NodeT* node) noexcept {
            return *node;
        }

        inline std::string fmt(const interval& iv) {
            return std::format("[{},{}]", iv.left, iv.right);
        }

        struct open_node {
            interval iv;
            bound_type next = 0;
            std::size_t children = 0;
        };

        inline validation_report validate_intervals(std::vector<interval> nodes) {
            validation_report report;
            if (nodes.empty()) {
                return report;
            }

            std::vector<bound_type> bounds;
            bounds.reserve(nodes.size() * 2);
            for (const auto& iv : nodes) {
                bounds.push_back(iv.left);
                bounds.push_back(iv.right);
            }
            std::ranges::sort(bounds);
            for (std::size_t i = 1; i < bounds.size(); ++i) {
                if (bounds[i] == bounds[i - 1]) {
                    report.problems.push_back(std::format("bound {} is used more than once", bounds[i]));
                }
            }

            std::ranges::sort(nodes, {}, &interval::left);

            std::vector<open_node> open;
            bound_type root_next = nodes.front().left;

            auto close_top = [&]() {
                const auto top = open.back();
                open.pop_back();
                if (top.children == 0 && top.iv.right != top.iv.left + 1) {
                    report.problems.push_back(std::format("childless node {} must have right = left + 1", fmt(top.iv)));
                }
                else if (top.children != 0 && top.next != top.iv.right) {
                    report.problems.push_back(std::format("last child of {} ends at {}, expected {}",
                        fmt(top.iv), top.next - 1, top.iv.right - 1));
                }
                if (open.empty()) {
                    root_next = top.iv.right + 1;
                }
                else {
                    open.back().next = top.iv.right + 1;
                }
            };

            for (const auto& iv : nodes) {
                if (iv.right <= iv.left) {
                    report.problems.push_back(std::format("node {} has right <= left", fmt(iv)));
                    continue;
                }
                while (!open.empty() && open.back().iv.right < iv.left) {
                    close_top();
                }
                if (!open.empty() && open.back().iv.right < iv.right) {
                    report.problems.push_back(std::format("node {} partially overlaps {}", fmt(iv), fmt(open.back().iv)));
                    continue;
                }
                if (open.empty()) {
                    if (iv.left != root_next) {
                        report.problems.push_back(std::format("root {} starts at {}, expected {}", fmt(iv), iv.left, root_next));
                    }
                }
                else {
                    auto& parent = open.back();
                    if (iv.left != parent.next) {
                        report.problems.push_back(std::format("child {} of {} starts at {}, expected {}",
                            fmt(iv), fmt(parent.iv), iv.left, parent.next));
                    }
                    ++parent.children;
                }
                open.push_back({ iv, iv.left + 1, 0 });
            }
            while (!open.empty()) {
                close_top();
            }
            return report;
        }
    } // namespace detail

    // Checks nesting, gap-free sibling chains, leaf width, a gap-free root
    // chain and distinct bounds. Accepts a range of nodes or node pointers.
    template <std::ranges::input_range R>
    validation_report validate(const R& nodes) {
        std::vector<interval> intervals;
        for (const auto& n : nodes) {
            intervals.push_back(interval_of(detail::as_node(n)));
        }
        return detail::validate_intervals(std::move(intervals));
    }

} // namespace nestrel::tree
