#pragma once

#include "styled_run.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TermMark {

enum class ParagraphMode {
	// Paragraphs are separated by "\n\n"
	BLANK_LINE,
	// The whole input is a single paragraph
	DOCUMENT,
};

enum class RenderMode {
	ANSI,
	PLAIN,
};

class DocumentElement {
	public:
		virtual ~DocumentElement() = default;

		virtual std::string render(RenderMode mode) const = 0;
};

/**
 * A block of inline-formatted text. The text is scanned once on construction.
 */
class Paragraph final : public DocumentElement {
	public:
		explicit Paragraph(std::string_view text);

		std::string render(RenderMode mode) const override;

		const StyledRuns& get_runs() const;
	private:
		StyledRuns m_runs;
};

using Document = std::vector<std::unique_ptr<DocumentElement>>;

[[nodiscard]] Document parse_document(std::string_view text, ParagraphMode mode = ParagraphMode::BLANK_LINE);
/**
 * Renders each element of the document followed by a blank line.
 */
[[nodiscard]] std::string render_document(const Document& document, RenderMode mode = RenderMode::ANSI);

}

