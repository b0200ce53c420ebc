#include "catalog.hpp"
#include "shell.hpp"
#include "nestrel/storage/file_device.hpp"
#include "nestrel/tree/policies.hpp"
#include "nestrel/tree/settings.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {
	using namespace nestrelctl;
	using device_type = nestrel::storage::file_device;
	using catalog_type = catalog<device_type>;

	struct tool_options {
		std::string filename;
		nestrel::tree::settings settings;
	};

	std::optional<std::string> optional_arg(const std::string& value) {
		if (value.empty()) {
			return std::nullopt;
		}
		return value;
	}

	void print_items(const std::vector<item*>& items) {
		for (const auto* i : items) {
			std::cout << std::format("{:<24} [{}, {}]\n", i->name, i->left, i->right);
		}
	}

	int cmd_init(const tool_options& opts) {
		try {
			std::filesystem::remove(opts.filename);
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			std::cout << "Tree initialized: " << opts.filename << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error initializing tree: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_add(const tool_options& opts, const std::string& name, const std::string& parent) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			const auto& added = cat.add(name, optional_arg(parent));
			std::cout << std::format("Added: {} [{}, {}]\n", added.name, added.left, added.right);
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error adding item: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_insert(const tool_options& opts, const std::string& name, const std::string& sibling) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			const auto& added = cat.insert(name, sibling);
			std::cout << std::format("Inserted: {} [{}, {}]\n", added.name, added.left, added.right);
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error inserting item: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_move(const tool_options& opts, const std::string& source, const std::string& target) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			cat.move(source, optional_arg(target));
			const auto& moved = cat.get(source);
			std::cout << std::format("Moved: {} [{}, {}]\n", moved.name, moved.left, moved.right);
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error moving item: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_ls(const tool_options& opts, const std::string& name) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			auto items = cat.children(optional_arg(name));
			std::cout << "Total entries: " << items.size() << "\n";
			print_items(items);
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error listing children: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_descendants(const tool_options& opts, const std::string& name) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			auto items = cat.descendants(name);
			std::cout << "Total entries: " << items.size() << "\n";
			print_items(items);
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error listing descendants: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_tree(const tool_options& opts) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			cat.dump(std::cout);
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error displaying tree: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_check(const tool_options& opts) {
		try {
			device_type dev(opts.filename);
			catalog_type cat(dev, opts.settings);
			auto report = cat.check();
			if (report.ok()) {
				std::cout << std::format("OK: {} items\n", cat.size());
				return 0;
			}
			for (const auto& problem : report.problems) {
				std::cerr << problem << "\n";
			}
			return 1;
		}
		catch (const std::exception& e) {
			std::cerr << "Error checking tree: " << e.what() << "\n";
			return 1;
		}
	}

	shell_commands make_shell_commands(const tool_options& opts) {
		using args_type = std::vector<std::string>;
		shell_commands cmds;
		cmds.add("init", { 0, 0, "init", [&](const args_type&) { return cmd_init(opts); } });
		cmds.add("add", { 1, 2, "add <name> [parent]",
			[&](const args_type& a) { return cmd_add(opts, a[0], a[1]); } });
		cmds.add("insert", { 2, 2, "insert <name> <sibling>",
			[&](const args_type& a) { return cmd_insert(opts, a[0], a[1]); } });
		cmds.add("move", { 1, 2, "move <source> [target]",
			[&](const args_type& a) { return cmd_move(opts, a[0], a[1]); } });
		cmds.add("ls", { 0, 1, "ls [name]", [&](const args_type& a) { return cmd_ls(opts, a[0]); } });
		cmds.add("descendants", { 1, 1, "descendants <name>",
			[&](const args_type& a) { return cmd_descendants(opts, a[0]); } });
		cmds.add("tree", { 0, 0, "tree", [&](const args_type&) { return cmd_tree(opts); } });
		cmds.add("check", { 0, 0, "check", [&](const args_type&) { return cmd_check(opts); } });
		return cmds;
	}

	void cmd_help(const shell_commands& cmds) {
		std::cout << "\nnestrel commands:\n";
		for (const auto& [name, cmd] : cmds.commands()) {
			std::cout << std::format("  {}\n", cmd.usage);
		}
		std::cout << "  help\n  exit/quit\n\n";
	}
}

void shell_mode(const tool_options& opts) {
	replxx::Replxx rx;
	rx.set_max_history_size(128);
	const auto cmds = make_shell_commands(opts);

	std::cout << "nestrel shell - " << opts.filename << "\n";
	std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

	while (const char* input = rx.input("nestrel> ")) {
		const std::string line(input);
		const auto words = split_command(line);
		if (words.empty()) {
			continue;
		}
		if (words.front() == "exit" || words.front() == "quit") {
			break;
		}
		if (words.front() == "help") {
			cmd_help(cmds);
		}
		else {
			cmds.dispatch(words, std::cerr);
		}
		rx.history_add(line);
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "nestrel - Nested-set tree command line tool" };

	tool_options opts;
	app.add_option("tree", opts.filename, "Tree file (.bin)")->required();

	const std::map<std::string, nestrel::tree::policies::gap> gap_policies{
		{ "cheapest", nestrel::tree::policies::gap::cheapest },
		{ "forward", nestrel::tree::policies::gap::forward },
		{ "backward", nestrel::tree::policies::gap::backward },
	};
	app.add_option("--gap-policy", opts.settings.gap_policy, "Side renumbered when a gap is opened")
		->transform(CLI::CheckedTransformer(gap_policies, CLI::ignore_case));
	app.add_flag("--verify", opts.settings.verify_mutations, "Check the tree invariants after every mutation");

	app.require_subcommand(1);

	std::string name;
	std::string other;
	int result = 0;

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell mode");
	shell_cmd->callback([&]() {
		shell_mode(opts);
		});

	auto init_cmd = app.add_subcommand("init", "Create an empty tree");
	init_cmd->callback([&]() {
		result = cmd_init(opts);
		});

	auto add_cmd = app.add_subcommand("add", "Add an item");
	add_cmd->add_option("name", name, "Item name")->required();
	add_cmd->add_option("parent", other, "Parent item (default: new root)");
	add_cmd->callback([&]() {
		result = cmd_add(opts, name, other);
		});

	auto insert_cmd = app.add_subcommand("insert", "Add an item before a sibling");
	insert_cmd->add_option("name", name, "Item name")->required();
	insert_cmd->add_option("sibling", other, "Sibling item")->required();
	insert_cmd->callback([&]() {
		result = cmd_insert(opts, name, other);
		});

	auto move_cmd = app.add_subcommand("move", "Move a subtree");
	move_cmd->add_option("source", name, "Item to move")->required();
	move_cmd->add_option("target", other, "New parent (default: last root)");
	move_cmd->callback([&]() {
		result = cmd_move(opts, name, other);
		});

	auto ls_cmd = app.add_subcommand("ls", "List direct children");
	ls_cmd->add_option("name", name, "Parent item (default: roots)");
	ls_cmd->callback([&]() {
		result = cmd_ls(opts, name);
		});

	auto descendants_cmd = app.add_subcommand("descendants", "List every item below an item");
	descendants_cmd->add_option("name", name, "Item name")->required();
	descendants_cmd->callback([&]() {
		result = cmd_descendants(opts, name);
		});

	auto tree_cmd = app.add_subcommand("tree", "Display the whole tree");
	tree_cmd->callback([&]() {
		result = cmd_tree(opts);
		});

	auto check_cmd = app.add_subcommand("check", "Verify the tree invariants");
	check_cmd->callback([&]() {
		result = cmd_check(opts);
		});

	CLI11_PARSE(app, argc, argv);

	return result;
}
