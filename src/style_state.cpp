#include "style_state.hpp"

#include <string_view>

using namespace TermMark;

namespace {

struct AttributeCodes {
	StyleFlags flag;
	std::string_view start;
	std::string_view end;
};

}

static constexpr const AttributeCodes g_attributeCodes[] = {
	{StyleFlags::BOLD, "\x1b[1m", "\x1b[22m"},
	{StyleFlags::ITALIC, "\x1b[3m", "\x1b[23m"},
	{StyleFlags::STRIKETHROUGH, "\x1b[9m", "\x1b[29m"},
};

std::string StyleState::get_start_codes() const {
	std::string codes;

	for (auto& attrib : g_attributeCodes) {
		if (has(attrib.flag)) {
			codes += attrib.start;
		}
	}

	return codes;
}

std::string StyleState::get_end_codes() const {
	std::string codes;

	for (auto& attrib : g_attributeCodes) {
		if (has(attrib.flag)) {
			codes += attrib.end;
		}
	}

	return codes;
}

std::string TermMark::get_transition_codes(StyleState previous, StyleState current) {
	auto added = current.get_flags() & ~previous.get_flags();
	auto removed = previous.get_flags() & ~current.get_flags();

	return StyleState(removed).get_end_codes() + StyleState(added).get_start_codes();
}

