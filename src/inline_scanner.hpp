#pragma once

#include "styled_run.hpp"

#include <string_view>

namespace TermMark {

/**
 * Splits a single paragraph of UTF-8 text into styled runs. Recognized markup:
 *
 * - `**` toggles bold, a single `*` toggles italic
 * - `~~` toggles strikethrough; a lone `~` is ordinary text
 * - `\` makes the following character literal; a trailing `\` is dropped
 * - a newline is folded into a single space
 *
 * Markup does not need to be balanced. A toggle left open stays active until the end of the paragraph.
 * The returned runs never contain empty text.
 */
[[nodiscard]] StyledRuns scan_inline_markup(std::string_view text);

}

