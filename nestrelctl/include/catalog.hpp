#pragma once

#include <format>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "nestrel/storage/device.hpp"
#include "nestrel/store/session.hpp"
#include "nestrel/store/stats.hpp"
#include "nestrel/store/table/file_table.hpp"
#include "nestrel/tree/manager.hpp"
#include "nestrel/tree/settings.hpp"
#include "nestrel/tree/validate.hpp"
#include "item.hpp"

namespace nestrelctl {

	class catalog_error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Named items kept in a nested-set tree on a device. Every mutation is
	// one transaction: the tree shift and the insert of a new item are
	// written together or not at all.
	template <nestrel::storage::RandomAccessDevice DevT>
	class catalog {
	public:

		using device_type = DevT;
		using table_type = nestrel::store::table::file_table<item, device_type>;
		using session_type = nestrel::store::session<table_type, nestrel::store::stats>;
		using manager_type = nestrel::tree::manager<session_type>;
		using item_list = std::vector<item*>;

		catalog(device_type& dev, nestrel::tree::settings s = {})
			: table_(dev)
			, session_(table_)
			, manager_(session_, s)
		{}

		item& add(const std::string& name, const std::optional<std::string>& parent = std::nullopt) {
			check_free(name);
			auto tx = session_.begin_transaction();
			item* parent_item = parent ? &get(*parent) : nullptr;
			auto& added = manager_.add_child(item{ name }, parent_item);
			session_.save_changes();
			tx.commit();
			return added;
		}

		item& insert(const std::string& name, const std::string& sibling) {
			check_free(name);
			auto tx = session_.begin_transaction();
			auto& added = manager_.insert_before(item{ name }, get(sibling));
			session_.save_changes();
			tx.commit();
			return added;
		}

		// No target: the item becomes the last root.
		void move(const std::string& source, const std::optional<std::string>& target = std::nullopt) {
			auto tx = session_.begin_transaction();
			if (target) {
				manager_.move(get(source), get(*target));
			}
			else {
				manager_.move_to_root(get(source));
			}
			tx.commit();
		}

		item_list children(const std::optional<std::string>& name = std::nullopt) {
			if (name) {
				return manager_.direct_children(get(*name));
			}
			return manager_.roots();
		}

		item_list descendants(const std::string& name) {
			return manager_.all_descendants(get(name));
		}

		item* find(const std::string& name) {
			return session_.find_if([&](const item& i) { return i.name == name; });
		}

		item& get(const std::string& name) {
			if (auto* found = find(name)) {
				return *found;
			}
			throw catalog_error(std::format("item not found: {}", name));
		}

		void dump(std::ostream& os) {
			manager_.dump(os, [](const item& i) { return i.name; });
		}

		nestrel::tree::validation_report check() {
			return manager_.check();
		}

		std::size_t size() const noexcept {
			return table_.size();
		}

		manager_type& get_manager() noexcept {
			return manager_;
		}

		session_type& get_session() noexcept {
			return session_;
		}

	private:

		void check_free(const std::string& name) {
			if (name.empty()) {
				throw catalog_error("item name can not be empty");
			}
			if (find(name) != nullptr) {
				throw catalog_error(std::format("item already exists: {}", name));
			}
		}

		table_type table_;
		session_type session_;
		manager_type manager_;
	};

}
