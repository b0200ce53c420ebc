#pragma once

#include <cstdint>
#include <string>
#include <tuple>

#include "nestrel/core/bytes.hpp"
#include "nestrel/codec/serializer.hpp"
#include "nestrel/tree/node.hpp"

namespace nestrelctl {

	struct item {
		std::string name;
		nestrel::tree::bound_type left = 0;
		nestrel::tree::bound_type right = 0;
	};

}

namespace nestrel::codec {

	// name, left, right
	template <>
	struct serializer<nestrelctl::item> {

		using value_type = nestrelctl::item;
		using name_serializer = serializer<std::string>;
		using bound_serializer = serializer<tree::bound_type>;

		static std::size_t store(const value_type& val, core::byte* where) {
			std::size_t shift = name_serializer::store(val.name, where);
			shift += bound_serializer::store(val.left, where + shift);
			shift += bound_serializer::store(val.right, where + shift);
			return shift;
		}

		static std::tuple<value_type, std::size_t> load(const core::byte* where, std::size_t available) {
			value_type val;
			auto [name, name_len] = name_serializer::load(where, available);
			if (name_len == 0) {
				return { value_type{}, 0 };
			}
			auto [left, left_len] = bound_serializer::load(where + name_len, available - name_len);
			if (left_len == 0) {
				return { value_type{}, 0 };
			}
			const auto used = name_len + left_len;
			auto [right, right_len] = bound_serializer::load(where + used, available - used);
			if (right_len == 0) {
				return { value_type{}, 0 };
			}
			val.name = std::move(name);
			val.left = left;
			val.right = right;
			return { std::move(val), used + right_len };
		}

		static std::size_t size(const value_type& val) {
			return name_serializer::size(val.name) + 2 * sizeof(tree::bound_type);
		}
	};

}
