#include "run_renderer.hpp"

using namespace TermMark;

std::string TermMark::render_runs(const StyledRuns& runs) {
	std::string result;
	StyleState previousStyle;

	for (auto& run : runs) {
		result += get_transition_codes(previousStyle, run.style);
		result += run.text;
		previousStyle = run.style;
	}

	result += get_transition_codes(previousStyle, StyleState{});

	return result;
}

std::string TermMark::render_runs_plain(const StyledRuns& runs) {
	std::string result;

	for (auto& run : runs) {
		result += run.text;
	}

	return result;
}

