#pragma once

#include <cstddef>
#include <functional>
#include <iomanip>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace nestrelctl {

	// Splits a shell line into words; "quoted names" keep their spaces.
	inline std::vector<std::string> split_command(const std::string& line) {
		std::vector<std::string> args;
		std::istringstream in(line);
		std::string word;
		while (in >> std::quoted(word)) {
			args.push_back(word);
		}
		return args;
	}

	// A shell command takes between `min_args` and `max_args` arguments
	// after its name. Missing optional arguments are passed as "".
	struct shell_command {
		std::size_t min_args = 0;
		std::size_t max_args = 0;
		std::string usage;
		std::function<int(const std::vector<std::string>&)> run;
	};

	class shell_commands {
	public:

		void add(const std::string& name, shell_command cmd) {
			commands_.insert_or_assign(name, std::move(cmd));
		}

		bool contains(const std::string& name) const {
			return commands_.contains(name);
		}

		// Returns the command's exit code, or 1 when the line does not fit
		// any command. Problems are reported to `err`.
		int dispatch(const std::vector<std::string>& words, std::ostream& err) const {
			if (words.empty()) {
				return 0;
			}
			auto itr = commands_.find(words.front());
			if (itr == commands_.end()) {
				err << "Unknown command: " << words.front() << " (type 'help' for available commands)\n";
				return 1;
			}
			const auto& cmd = itr->second;
			const auto given = words.size() - 1;
			if (given < cmd.min_args || given > cmd.max_args) {
				err << "Usage: " << cmd.usage << "\n";
				return 1;
			}
			std::vector<std::string> args(words.begin() + 1, words.end());
			args.resize(cmd.max_args);
			return cmd.run(args);
		}

		const std::map<std::string, shell_command>& commands() const noexcept {
			return commands_;
		}

	private:
		std::map<std::string, shell_command> commands_;
	};

}
