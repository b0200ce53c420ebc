/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include <stdexcept>
#include <string>

namespace nestrel::tree {

    class tree_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A parent, sibling, source or target the store does not track.
    class detached_reference_error : public tree_error {
    public:
        explicit detached_reference_error(const std::string& role)
            : tree_error(role + " node has not been added yet")
            , role_(role)
        {}

        const std::string& role() const noexcept {
            return role_;
        }

    private:
        std::string role_;
    };

    class illegal_relocation_error : public tree_error {
    public:
        using tree_error::tree_error;
    };

    class malformed_shift_error : public tree_error {
    public:
        malformed_shift_error()
            : tree_error("shift requires at least one bound")
        {}
    };

} // namespace nestrel::tree
