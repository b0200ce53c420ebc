#include "tests.hpp"
#include "catalog.hpp"

#include "nestrel/storage/file_device.hpp"
#include "nestrel/storage/memory_device.hpp"

#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {
	using namespace nestrelctl;
	using file_catalog_type = catalog<nestrel::storage::file_device>;
	using memory_catalog_type = catalog<nestrel::storage::memory_device>;

	static std::filesystem::path temp_file(const char* stem) {
		namespace fs = std::filesystem;
		static std::random_device rd;
		auto p = fs::temp_directory_path() / (std::string(stem) + "_" + std::to_string(rd()) + ".bin");
		return p;
	}

	std::vector<std::string> names(const std::vector<item*>& items) {
		std::vector<std::string> result;
		for (const auto* i : items) {
			result.push_back(i->name);
		}
		return result;
	}

	nestrel::tree::settings forward() {
		nestrel::tree::settings s;
		s.gap_policy = nestrel::tree::policies::gap::forward;
		return s;
	}
}

TEST_SUITE("nestrelctl/item") {
	TEST_CASE("serializer keeps name and bounds") {
		using item_serializer = nestrel::codec::serializer<item>;
		const item src{ "iPhone SE", -3, 12 };
		nestrel::core::byte_buffer buf;
		CHECK(nestrel::codec::append(buf, src) == item_serializer::size(src));

		auto [back, used] = item_serializer::load(buf.data(), buf.size());
		CHECK(used == buf.size());
		CHECK(back.name == "iPhone SE");
		CHECK(back.left == -3);
		CHECK(back.right == 12);

		auto [cut, cut_used] = item_serializer::load(buf.data(), buf.size() - 1);
		CHECK(cut_used == 0);
	}
}

TEST_SUITE("nestrelctl/catalog") {

	TEST_CASE("add, insert and list") {
		nestrel::storage::memory_device dev;
		memory_catalog_type cat(dev, forward());

		cat.add("Electronics");
		cat.add("Clothing");
		cat.add("SmartPhones", "Electronics");
		cat.add("Laptops", "Electronics");
		cat.insert("Tablets", "Laptops");

		CHECK(names(cat.children()) == std::vector<std::string>{ "Electronics", "Clothing" });
		CHECK(names(cat.children("Electronics")) == std::vector<std::string>{ "SmartPhones", "Tablets", "Laptops" });
		CHECK(names(cat.descendants("Electronics")) == std::vector<std::string>{ "SmartPhones", "Tablets", "Laptops" });
		CHECK(cat.get("Electronics").left == 1);
		CHECK(cat.get("Electronics").right == 8);
		CHECK(cat.get("Clothing").left == 9);
		CHECK(cat.size() == 5);
		CHECK(cat.get_session().pending() == 0);
		CHECK(cat.check().ok());
	}

	TEST_CASE("names are unique and must exist") {
		nestrel::storage::memory_device dev;
		memory_catalog_type cat(dev);
		cat.add("Electronics");

		CHECK_THROWS_AS(cat.add("Electronics"), catalog_error);
		CHECK_THROWS_AS(cat.add(""), catalog_error);
		CHECK_THROWS_AS(cat.add("Phones", "Nowhere"), catalog_error);
		CHECK_THROWS_AS(cat.insert("Phones", "Nowhere"), catalog_error);
		CHECK_THROWS_AS(cat.move("Nowhere"), catalog_error);
		CHECK(cat.find("Phones") == nullptr);
		CHECK(cat.size() == 1);
	}

	TEST_CASE("move and move to root") {
		nestrel::storage::memory_device dev;
		memory_catalog_type cat(dev, forward());
		cat.add("E");
		cat.add("A", "E");
		cat.add("a", "A");
		cat.add("B", "E");
		cat.add("b", "B");

		cat.move("A", "B");
		CHECK(names(cat.children("B")) == std::vector<std::string>{ "b", "A" });
		CHECK(cat.get("A").left == 5);
		CHECK(cat.get("A").right == 8);

		cat.move("B");
		CHECK(names(cat.children()) == std::vector<std::string>{ "E", "B" });
		CHECK(cat.get("E").right == 2);
		CHECK(cat.check().ok());

		CHECK_THROWS_AS(cat.move("B", "a"), nestrel::tree::illegal_relocation_error);
		CHECK(cat.check().ok());
	}

	TEST_CASE("dump") {
		nestrel::storage::memory_device dev;
		memory_catalog_type cat(dev, forward());
		std::ostringstream empty;
		cat.dump(empty);
		CHECK(empty.str() == "<Empty>\n");

		cat.add("E");
		cat.add("S", "E");
		std::ostringstream out;
		cat.dump(out);
		CHECK(out.str() == "E [1, 4]\n  S [2, 3]\n");
	}

	TEST_CASE("tree survives reopening the file") {
		namespace fs = std::filesystem;
		auto path = temp_file("nestrelctl_test");
		{
			nestrel::storage::file_device dev(path);
			file_catalog_type cat(dev);
			cat.add("Electronics");
			cat.add("SmartPhones", "Electronics");
			cat.add("Android", "SmartPhones");
			cat.add("Laptops", "Electronics");
			cat.add("Clothing");
			cat.move("Android", "Laptops");
		}
		{
			nestrel::storage::file_device dev(path);
			file_catalog_type cat(dev);
			CHECK(cat.size() == 5);
			CHECK(cat.check().ok());
			CHECK(names(cat.children("Laptops")) == std::vector<std::string>{ "Android" });
			CHECK(cat.children("SmartPhones").empty());
			CHECK(names(cat.children()) == std::vector<std::string>{ "Electronics", "Clothing" });
		}
		CHECK(fs::remove(path));
	}
}
