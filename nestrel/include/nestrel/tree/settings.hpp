/*
 * File: settings.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */

#pragma once

#include "nestrel/tree/policies.hpp"

namespace nestrel::tree {
    struct settings {
        policies::gap gap_policy = policies::gap::cheapest;
        bool verify_mutations = false;
    };
}
