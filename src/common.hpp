#pragma once

#include <type_traits>

#define TERMMARK_ENUM_VALUE(T, a) static_cast<std::underlying_type_t<T>>(a)

#define TERMMARK_DEFINE_ENUM_BITFLAG_OPERATORS(Enum)												\
	static_assert(std::is_enum_v<Enum>);															\
	constexpr Enum operator~(Enum a) noexcept {														\
		return static_cast<Enum>(~TERMMARK_ENUM_VALUE(Enum, a));									\
	}																								\
	constexpr Enum operator|(Enum a, Enum b) noexcept {												\
		return static_cast<Enum>(TERMMARK_ENUM_VALUE(Enum, a) | TERMMARK_ENUM_VALUE(Enum, b));		\
	}																								\
	constexpr Enum operator&(Enum a, Enum b) noexcept {												\
		return static_cast<Enum>(TERMMARK_ENUM_VALUE(Enum, a) & TERMMARK_ENUM_VALUE(Enum, b));		\
	}																								\
	constexpr Enum& operator^=(Enum& a, Enum b) noexcept {											\
		return a = static_cast<Enum>(TERMMARK_ENUM_VALUE(Enum, a) ^ TERMMARK_ENUM_VALUE(Enum, b));	\
	}

