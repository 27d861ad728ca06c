#include "document.hpp"

#include "inline_scanner.hpp"
#include "run_renderer.hpp"

using namespace TermMark;

static constexpr std::string_view PARAGRAPH_SEPARATOR = "\n\n";

// Paragraph

Paragraph::Paragraph(std::string_view text)
		: m_runs(scan_inline_markup(text)) {}

std::string Paragraph::render(RenderMode mode) const {
	switch (mode) {
		case RenderMode::PLAIN:
			return render_runs_plain(m_runs);
		case RenderMode::ANSI:
		default:
			return render_runs(m_runs);
	}
}

const StyledRuns& Paragraph::get_runs() const {
	return m_runs;
}

// Document

Document TermMark::parse_document(std::string_view text, ParagraphMode mode) {
	Document result;

	if (mode == ParagraphMode::DOCUMENT) {
		result.emplace_back(std::make_unique<Paragraph>(text));
		return result;
	}

	for (;;) {
		auto end = text.find(PARAGRAPH_SEPARATOR);

		if (end == std::string_view::npos) {
			result.emplace_back(std::make_unique<Paragraph>(text));
			break;
		}

		result.emplace_back(std::make_unique<Paragraph>(text.substr(0, end)));
		text.remove_prefix(end + PARAGRAPH_SEPARATOR.size());
	}

	return result;
}

std::string TermMark::render_document(const Document& document, RenderMode mode) {
	std::string result;

	for (auto& element : document) {
		result += element->render(mode);
		result += PARAGRAPH_SEPARATOR;
	}

	return result;
}

