#pragma once

#include <doctest/doctest.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "nestrel/store/session.hpp"
#include "nestrel/store/stats.hpp"
#include "nestrel/store/table/memory_table.hpp"
#include "nestrel/tree/manager.hpp"
#include "nestrel/tree/node.hpp"
#include "nestrel/tree/settings.hpp"

namespace nestrel::testing {

    struct named_node {
        std::string name;
        tree::bound_type left = 0;
        tree::bound_type right = 0;
    };

    using table_type = store::table::memory_table<named_node>;
    using session_type = store::session<table_type, store::stats>;
    using manager_type = tree::manager<session_type>;

    // A session over an in-memory table with a manager on top. Nodes are
    // looked up by name through the session.
    struct tree_fixture {

        explicit tree_fixture(tree::settings s = {})
            : session(table)
            , manager(session, s)
        {}

        named_node& add(const std::string& name, const named_node* parent = nullptr) {
            return manager.add_child(named_node{ name }, parent);
        }

        named_node& add(const std::string& name, const std::string& parent) {
            return add(name, &node(parent));
        }

        named_node& node(const std::string& name) {
            auto* found = session.find_if([&](const named_node& n) { return n.name == name; });
            REQUIRE(found != nullptr);
            return *found;
        }

        tree::interval bounds(const std::string& name) {
            return tree::interval_of(node(name));
        }

        std::map<std::string, tree::interval> snapshot() {
            std::map<std::string, tree::interval> result;
            for (auto* n : session.read_all()) {
                result.emplace(n->name, tree::interval_of(*n));
            }
            return result;
        }

        static std::vector<std::string> names(const std::vector<named_node*>& nodes) {
            std::vector<std::string> result;
            for (const auto* n : nodes) {
                result.push_back(n->name);
            }
            return result;
        }

        // Electronics
        //   SmartPhones: Android, iPhones (iPhone SE, iPhone Pro)
        //   Laptops: Windows, MacBooks
        //   Computers: Desktops (HP, Dell)
        // Clothing
        void build_catalog() {
            add("Electronics");
            add("SmartPhones", "Electronics");
            add("Android", "SmartPhones");
            add("iPhones", "SmartPhones");
            add("iPhone SE", "iPhones");
            add("iPhone Pro", "iPhones");
            add("Laptops", "Electronics");
            add("Windows", "Laptops");
            add("MacBooks", "Laptops");
            add("Computers", "Electronics");
            add("Desktops", "Computers");
            add("HP", "Desktops");
            add("Dell", "Desktops");
            add("Clothing");
        }

        table_type table;
        session_type session;
        manager_type manager;
    };

    inline tree::settings forward_settings() {
        tree::settings s;
        s.gap_policy = tree::policies::gap::forward;
        return s;
    }

} // namespace nestrel::testing
