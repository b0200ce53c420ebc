/*
 * File: policies.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once
namespace nestrel::tree::policies {

    // Which side of the tree gets renumbered when a gap is opened.
    enum class gap {
        cheapest,
        forward,
        backward,
    };

} // namespace nestrel::tree::policies
