#pragma once

#include "common.hpp"

#include <cstdint>

#include <string>

namespace TermMark {

enum class StyleFlags : uint8_t {
	NONE = 0,
	BOLD = 1 << 0,
	ITALIC = 1 << 1,
	STRIKETHROUGH = 1 << 2,
};

TERMMARK_DEFINE_ENUM_BITFLAG_OPERATORS(StyleFlags)

/**
 * The set of text attributes active at a point in the text. Attributes are independent of each other;
 * the default-constructed state has none of them set and is both the initial and final state of any
 * rendered paragraph.
 */
class StyleState {
	public:
		constexpr StyleState() = default;
		constexpr explicit StyleState(StyleFlags flags)
				: m_flags(flags) {}

		constexpr void toggle(StyleFlags flags) {
			m_flags ^= flags;
		}

		constexpr void toggle_bold() {
			toggle(StyleFlags::BOLD);
		}

		constexpr void toggle_italic() {
			toggle(StyleFlags::ITALIC);
		}

		constexpr void toggle_strikethrough() {
			toggle(StyleFlags::STRIKETHROUGH);
		}

		constexpr bool has(StyleFlags flags) const {
			return flags != StyleFlags::NONE && (m_flags & flags) == flags;
		}

		constexpr bool empty() const {
			return m_flags == StyleFlags::NONE;
		}

		constexpr StyleFlags get_flags() const {
			return m_flags;
		}

		constexpr bool operator==(const StyleState&) const = default;

		/**
		 * Codes enabling every attribute of this state, in bold, italic, strikethrough order.
		 */
		std::string get_start_codes() const;
		/**
		 * Codes disabling every attribute of this state, in bold, italic, strikethrough order.
		 */
		std::string get_end_codes() const;
	private:
		StyleFlags m_flags{StyleFlags::NONE};
};

/**
 * Returns the codes needed to move the terminal from `previous` to `current`: the end codes of all
 * attributes dropped by `current`, followed by the start codes of all attributes it adds. Attributes
 * present in both states produce no output.
 */
std::string get_transition_codes(StyleState previous, StyleState current);

}

