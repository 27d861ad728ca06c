#pragma once

#include "document.hpp"

#include <string_view>

namespace TermMark {

struct Config {
	ParagraphMode paragraphMode{ParagraphMode::BLANK_LINE};
	RenderMode renderMode{RenderMode::ANSI};
};

enum class ConfigError {
	NONE,
	FILE_READ_FAILED,
	INVALID_JSON,
	INVALID_VALUE,
};

/**
 * Applies the settings of a JSON config object on top of `config`. All keys are optional:
 *
 * - "paragraphs": "blank-line" or "document"
 * - "strip": boolean, render without escape codes when true
 *
 * Unknown keys are ignored. If an error is returned `config` is left unchanged.
 */
[[nodiscard]] ConfigError load_config_from_json_data(std::string_view data, Config& config);
[[nodiscard]] ConfigError load_config_from_json_file(const char* fileName, Config& config);

const char* get_config_error_message(ConfigError error);

}

