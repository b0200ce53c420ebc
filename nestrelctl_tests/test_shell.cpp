#include "tests.hpp"
#include "shell.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {
	using namespace nestrelctl;
	using args_type = std::vector<std::string>;

	shell_commands make_table(args_type& seen) {
		shell_commands cmds;
		cmds.add("add", { 1, 2, "add <name> [parent]", [&](const args_type& a) {
			seen = a;
			return 0;
		} });
		cmds.add("fail", { 0, 0, "fail", [](const args_type&) { return 7; } });
		return cmds;
	}
}

TEST_SUITE("nestrelctl/shell") {

	TEST_CASE("split keeps quoted names together") {
		const auto words = split_command(R"(add "iPhone SE" iPhones)");
		REQUIRE(words.size() == 3);
		CHECK(words[0] == "add");
		CHECK(words[1] == "iPhone SE");
		CHECK(words[2] == "iPhones");

		CHECK(split_command("   ").empty());
		CHECK(split_command("  tree  ") == args_type{ "tree" });
	}

	TEST_CASE("dispatch pads missing optional arguments") {
		args_type seen;
		auto cmds = make_table(seen);
		std::ostringstream err;

		CHECK(cmds.dispatch({ "add", "Phones" }, err) == 0);
		CHECK(seen == args_type{ "Phones", "" });

		CHECK(cmds.dispatch({ "add", "iPhones", "Phones" }, err) == 0);
		CHECK(seen == args_type{ "iPhones", "Phones" });
		CHECK(err.str().empty());
	}

	TEST_CASE("dispatch returns the command's exit code") {
		args_type seen;
		auto cmds = make_table(seen);
		std::ostringstream err;
		CHECK(cmds.dispatch({ "fail" }, err) == 7);
		CHECK(cmds.dispatch({}, err) == 0);
		CHECK(err.str().empty());
	}

	TEST_CASE("dispatch rejects unknown commands") {
		args_type seen;
		auto cmds = make_table(seen);
		std::ostringstream err;
		CHECK_FALSE(cmds.contains("rm"));
		CHECK(cmds.dispatch({ "rm", "Phones" }, err) == 1);
		CHECK(err.str().find("Unknown command: rm") != std::string::npos);
		CHECK(seen.empty());
	}

	TEST_CASE("dispatch prints usage on a wrong argument count") {
		args_type seen;
		auto cmds = make_table(seen);

		std::ostringstream few;
		CHECK(cmds.dispatch({ "add" }, few) == 1);
		CHECK(few.str() == "Usage: add <name> [parent]\n");

		std::ostringstream many;
		CHECK(cmds.dispatch({ "add", "a", "b", "c" }, many) == 1);
		CHECK(many.str() == "Usage: add <name> [parent]\n");
		CHECK(seen.empty());
	}
}
