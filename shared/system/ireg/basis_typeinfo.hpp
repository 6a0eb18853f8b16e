#pragma once
#include <string>
#include <typeinfo>

#include "common/helper.hpp"

namespace ireg
{

	// Similar to std::type_index, but one static TypeInfo per type so that
	// equality is a pointer compare.
	struct TypeInfo {

		explicit TypeInfo(const std::type_info& info)
			: info(&info) {}

		// 사람이 읽을 수 있는 타입 이름 (로그용)
		std::string name() const {
			return demangle(info->name());
		};

	private:
		const std::type_info* info;
	};

	struct TypeId {
		const TypeInfo* type_info = nullptr;

		explicit operator std::string() const { return type_info ? type_info->name() : "<none>"; };

		bool operator==(TypeId x) const { return type_info == x.type_info; };
		bool operator!=(TypeId x) const { return type_info != x.type_info; };
		bool operator<(TypeId x) const { return type_info < x.type_info; };
	};

	template <typename T>
	inline TypeId getTypeId() {
		static TypeInfo info(typeid(T));
		return TypeId{ &info };
	};

}; // namespace ireg
