#include "inline_scanner.hpp"

#include <unicode/utf8.h>

#include <cstdint>
#include <utility>

using namespace TermMark;

static constexpr const UChar32 SENTINEL = U_SENTINEL;

namespace {

class InlineScanner {
	public:
		explicit InlineScanner(std::string_view text);

		void scan();

		StyledRuns get_result();
	private:
		const char* m_text;
		int64_t m_length;
		int64_t m_iter{};
		int64_t m_sliceStart{};
		StyleState m_style;
		StyledRuns m_runs;

		void scan_escape(int64_t charIndex);
		void scan_newline(int64_t charIndex);
		void scan_asterisk(int64_t charIndex);
		void scan_tilde(int64_t charIndex);

		void push_slice(int64_t limit, std::string_view suffix = {});

		UChar32 next_char();
		UChar32 peek_char() const;
};

}

StyledRuns TermMark::scan_inline_markup(std::string_view text) {
	InlineScanner scanner(text);
	scanner.scan();
	return scanner.get_result();
}

// InlineScanner

InlineScanner::InlineScanner(std::string_view text)
		: m_text(text.data())
		, m_length(static_cast<int64_t>(text.size())) {}

void InlineScanner::scan() {
	for (;;) {
		auto charIndex = m_iter;
		auto c = next_char();

		switch (c) {
			case SENTINEL:
				if (m_sliceStart != m_length) {
					push_slice(m_length);
				}

				return;
			case '\\':
				scan_escape(charIndex);
				break;
			case '\n':
				scan_newline(charIndex);
				break;
			case '*':
				scan_asterisk(charIndex);
				break;
			case '~':
				scan_tilde(charIndex);
				break;
			default:
				break;
		}
	}
}

StyledRuns InlineScanner::get_result() {
	return std::move(m_runs);
}

void InlineScanner::scan_escape(int64_t charIndex) {
	push_slice(charIndex);

	// The escaped character opens the next slice. With nothing left to escape the slice starts at the
	// end of the text, which drops the backslash.
	m_sliceStart = m_iter;
	next_char();
}

void InlineScanner::scan_newline(int64_t charIndex) {
	push_slice(charIndex, " ");
	m_sliceStart = m_iter;
}

void InlineScanner::scan_asterisk(int64_t charIndex) {
	push_slice(charIndex);

	if (peek_char() == '*') {
		next_char();
		m_style.toggle_bold();
	}
	else {
		m_style.toggle_italic();
	}

	m_sliceStart = m_iter;
}

void InlineScanner::scan_tilde(int64_t charIndex) {
	if (peek_char() != '~') {
		return;
	}

	push_slice(charIndex);
	next_char();
	m_style.toggle_strikethrough();
	m_sliceStart = m_iter;
}

void InlineScanner::push_slice(int64_t limit, std::string_view suffix) {
	std::string text(m_text + m_sliceStart, m_text + limit);
	text += suffix;

	if (!text.empty()) {
		m_runs.push_back({std::move(text), m_style});
	}
}

UChar32 InlineScanner::next_char() {
	if (m_iter >= m_length) {
		return SENTINEL;
	}

	UChar32 c;
	U8_NEXT_OR_FFFD(m_text, m_iter, m_length, c);
	return c;
}

UChar32 InlineScanner::peek_char() const {
	if (m_iter >= m_length) {
		return SENTINEL;
	}

	// Delimiters are ASCII, so a lead byte is enough to tell them apart
	return static_cast<UChar32>(static_cast<uint8_t>(m_text[m_iter]));
}

