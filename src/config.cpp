#include "config.hpp"

#include "file_read_bytes.hpp"

#include <simdjson.h>

using namespace TermMark;

static ConfigError parse_paragraph_mode(std::string_view name, ParagraphMode& mode);

ConfigError TermMark::load_config_from_json_data(std::string_view data, Config& config) {
	simdjson::padded_string json(data);
	simdjson::ondemand::parser parser;
	simdjson::ondemand::document doc;

	if (parser.iterate(json).get(doc) != 0) {
		return ConfigError::INVALID_JSON;
	}

	simdjson::ondemand::object root;
	if (doc.get(root) != 0) {
		return ConfigError::INVALID_JSON;
	}

	Config result = config;

	auto paragraphs = root["paragraphs"];
	if (paragraphs.error() != simdjson::NO_SUCH_FIELD) {
		std::string_view modeName;
		if (paragraphs.get(modeName) != 0) {
			return ConfigError::INVALID_JSON;
		}

		if (auto res = parse_paragraph_mode(modeName, result.paragraphMode); res != ConfigError::NONE) {
			return res;
		}
	}

	auto strip = root["strip"];
	if (strip.error() != simdjson::NO_SUCH_FIELD) {
		bool stripValue;
		if (strip.get(stripValue) != 0) {
			return ConfigError::INVALID_JSON;
		}

		result.renderMode = stripValue ? RenderMode::PLAIN : RenderMode::ANSI;
	}

	config = result;

	return ConfigError::NONE;
}

ConfigError TermMark::load_config_from_json_file(const char* fileName, Config& config) {
	std::vector<char> fileData;
	if (file_read_bytes(fileName, fileData) != FileReadError::NONE) {
		return ConfigError::FILE_READ_FAILED;
	}

	return load_config_from_json_data(std::string_view(fileData.data(), fileData.size()), config);
}

const char* TermMark::get_config_error_message(ConfigError error) {
	switch (error) {
		case ConfigError::NONE:
			return "no error";
		case ConfigError::FILE_READ_FAILED:
			return "unable to read config file";
		case ConfigError::INVALID_JSON:
			return "config is not a valid JSON object";
		case ConfigError::INVALID_VALUE:
			return "config contains an unsupported value";
	}

	return "unknown error";
}

static ConfigError parse_paragraph_mode(std::string_view name, ParagraphMode& mode) {
	if (name.compare("blank-line") == 0) {
		mode = ParagraphMode::BLANK_LINE;
	}
	else if (name.compare("document") == 0) {
		mode = ParagraphMode::DOCUMENT;
	}
	else {
		return ConfigError::INVALID_VALUE;
	}

	return ConfigError::NONE;
}

