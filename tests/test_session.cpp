// tests/test_session.cpp
#include "tests.hpp"

#include "nestrel/store/session.hpp"
#include "nestrel/store/table/memory_table.hpp"
#include "nestrel/tree/concepts.hpp"

using namespace nestrel;
using namespace nestrel::testing;
using nestrel::tree::interval;
using nestrel::tree::field;
using nestrel::tree::predicate;
using nestrel::tree::range;

static_assert(tree::concepts::NodeStore<session_type>);
static_assert(tree::concepts::TransactionalStore<session_type>);
static_assert(tree::concepts::TransactionalStore<store::session<table_type>>);

TEST_SUITE("store/session") {

    TEST_CASE("add stages until save_changes") {
        table_type table;
        session_type s(table);

        auto& a = s.add(named_node{ "a", 1, 2 });
        auto& b = s.add(named_node{ "b", 3, 4 });
        CHECK(s.is_attached(a));
        CHECK(s.pending() == 2);
        CHECK(table.size() == 0);
        CHECK(s.read_all().size() == 2);
        CHECK_FALSE(s.key_of(a).has_value());

        CHECK(s.save_changes() == 2);
        CHECK(table.size() == 2);
        CHECK(s.pending() == 0);
        CHECK(s.state_of(a) == store::entity_state::unchanged);
        CHECK(s.key_of(a) == std::optional<table_type::key_type>{ 1 });
        CHECK(s.key_of(b) == std::optional<table_type::key_type>{ 2 });
        CHECK(s.get_stats().rows_inserted == 2);

        CHECK(s.save_changes() == 0);
        CHECK(table.size() == 2);
    }

    TEST_CASE("detached entities") {
        table_type table;
        session_type s(table);
        named_node outside{ "x", 1, 2 };
        CHECK_FALSE(s.is_attached(outside));
        CHECK_FALSE(s.state_of(outside).has_value());
    }

    TEST_CASE("one row is one entity") {
        table_type table;
        table.insert(named_node{ "a", 1, 4 });
        table.insert(named_node{ "b", 2, 3 });

        session_type s(table);
        auto* a = s.find(1);
        REQUIRE(a != nullptr);
        CHECK(a->name == "a");
        CHECK(s.find(1) == a);
        CHECK(s.is_attached(*a));

        auto all = s.read_all();
        REQUIRE(all.size() == 2);
        CHECK(all[0] == a);
        CHECK(s.range_query(predicate::on(field::left, range::exactly(2))).front() == all[1]);

        CHECK(s.tracked() == 2);
        CHECK(s.get_stats().rows_loaded == 2);
        CHECK(s.find(42) == nullptr);
    }

    TEST_CASE("bulk_update reaches table rows and tracked entities") {
        table_type table;
        table.insert(named_node{ "a", 1, 2 });
        table.insert(named_node{ "b", 3, 4 });

        session_type s(table);
        auto* b = s.find(2);
        REQUIRE(b != nullptr);
        auto& c = s.add(named_node{ "c", 5, 6 });

        const auto touched = s.bulk_update(predicate::on(field::left, range::at_least(3)), field::left, 10);
        CHECK(touched == 2);
        CHECK(b->left == 13);
        CHECK(c.left == 15);
        CHECK(table.load(2)->left == 13);
        CHECK(table.load(1)->left == 1);
    }

    TEST_CASE("min and max cover both tiers") {
        table_type table;
        table.insert(named_node{ "a", 3, 4 });
        session_type s(table);
        CHECK(s.min(field::left) == std::optional<tree::bound_type>{ 3 });
        s.add(named_node{ "b", 1, 2 });
        s.add(named_node{ "c", 5, 6 });
        CHECK(s.min(field::left) == std::optional<tree::bound_type>{ 1 });
        CHECK(s.max(field::right) == std::optional<tree::bound_type>{ 6 });

        table_type empty;
        session_type e(empty);
        CHECK_FALSE(e.min(field::left).has_value());
        CHECK_FALSE(e.max(field::right).has_value());
    }

    TEST_CASE("transaction rollback restores everything") {
        table_type table;
        table.insert(named_node{ "a", 1, 2 });
        session_type s(table);
        auto* a = s.find(1);
        REQUIRE(a != nullptr);
        auto& staged = s.add(named_node{ "b", 3, 4 });

        {
            auto tx = s.begin_transaction();
            CHECK(tx.is_active());
            s.add(named_node{ "c", 5, 6 });
            s.bulk_update(predicate::on(field::right, range::at_least(1)), field::right, 100);
            s.save_changes();
            CHECK(table.size() == 3);
            CHECK(a->right == 102);
        }

        CHECK(table.size() == 1);
        CHECK(table.load(1)->right == 2);
        CHECK(a->right == 2);
        CHECK(staged.right == 4);
        CHECK(s.state_of(staged) == store::entity_state::added);
        CHECK(s.tracked() == 2);
        CHECK(s.pending() == 1);
    }

    TEST_CASE("rollback restores key lookups") {
        table_type table;
        table.insert(named_node{ "a", 1, 4 });
        table.insert(named_node{ "b", 2, 3 });
        session_type s(table);
        auto* a = s.find(1);
        REQUIRE(a != nullptr);

        {
            auto tx = s.begin_transaction();
            REQUIRE(s.find(2) != nullptr);
            s.add(named_node{ "c", 5, 6 });
            s.save_changes();
            REQUIRE(s.find(3) != nullptr);
            CHECK(s.tracked() == 3);
        }

        CHECK(s.tracked() == 1);
        CHECK(s.find(1) == a);
        CHECK(s.find(3) == nullptr);

        // a row first loaded inside the rolled back transaction is loaded again
        auto* b = s.find(2);
        REQUIRE(b != nullptr);
        CHECK(b->name == "b");
        CHECK(s.is_attached(*b));
        CHECK(s.key_of(*b) == std::optional<table_type::key_type>{ 2 });
        CHECK(s.tracked() == 2);
        CHECK(s.read_all().size() == 2);
    }

    TEST_CASE("transaction commit keeps the changes") {
        table_type table;
        session_type s(table);
        {
            auto tx = s.begin_transaction();
            s.add(named_node{ "a", 1, 2 });
            s.save_changes();
            tx.commit();
            CHECK_FALSE(tx.is_active());
        }
        CHECK(table.size() == 1);
        CHECK(s.tracked() == 1);
    }

    TEST_CASE("nested transactions are flat") {
        table_type table;
        session_type s(table);
        auto outer = s.begin_transaction();
        s.add(named_node{ "a", 1, 2 });
        {
            auto inner = s.begin_transaction();
            s.save_changes();
            inner.commit();
        }
        CHECK(table.size() == 1);
        CHECK(table.in_transaction());

        {
            auto inner = s.begin_transaction();
            s.add(named_node{ "b", 3, 4 });
        }
        // the inner rollback discarded the outer work as well
        CHECK(table.size() == 0);
        CHECK(s.tracked() == 0);
        CHECK_FALSE(table.in_transaction());

        outer.commit();
        CHECK(table.size() == 0);
    }

    TEST_CASE("find_if looks at both tiers") {
        table_type table;
        table.insert(named_node{ "saved", 1, 2 });
        session_type s(table);
        s.add(named_node{ "staged", 3, 4 });

        auto* saved = s.find_if([](const named_node& n) { return n.name == "saved"; });
        auto* staged = s.find_if([](const named_node& n) { return n.name == "staged"; });
        REQUIRE(saved != nullptr);
        REQUIRE(staged != nullptr);
        CHECK(s.state_of(*saved) == store::entity_state::unchanged);
        CHECK(s.state_of(*staged) == store::entity_state::added);
        CHECK(s.find_if([](const named_node& n) { return n.name == "missing"; }) == nullptr);
    }
}
