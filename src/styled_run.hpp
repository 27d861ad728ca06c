#pragma once

#include "style_state.hpp"

#include <string>
#include <vector>

namespace TermMark {

/**
 * A piece of paragraph text together with the style active over it. `text` is owned by the run and is
 * never empty in runs produced by the scanner.
 */
struct StyledRun {
	std::string text;
	StyleState style;

	bool operator==(const StyledRun&) const = default;
};

using StyledRuns = std::vector<StyledRun>;

}

