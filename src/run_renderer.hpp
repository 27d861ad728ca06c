#pragma once

#include "styled_run.hpp"

#include <string>

namespace TermMark {

/**
 * Renders runs as text with embedded ANSI SGR codes. Only the attributes that change between two
 * consecutive runs are switched, and any attribute still active after the last run is switched off.
 * An empty run list renders to an empty string.
 */
[[nodiscard]] std::string render_runs(const StyledRuns& runs);
/**
 * Renders runs as plain text, discarding their styles.
 */
[[nodiscard]] std::string render_runs_plain(const StyledRuns& runs);

}

