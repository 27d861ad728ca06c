#include <catch2/catch_test_macros.hpp>

#include <config.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

using namespace TermMark;

TEST_CASE("Config Defaults", "[Config]") {
	Config config{};

	REQUIRE(config.paragraphMode == ParagraphMode::BLANK_LINE);
	REQUIRE(config.renderMode == RenderMode::ANSI);
}

TEST_CASE("Config From JSON Data", "[Config]") {
	Config config{};

	SECTION("Empty Object") {
		REQUIRE(load_config_from_json_data("{}", config) == ConfigError::NONE);
		REQUIRE(config.paragraphMode == ParagraphMode::BLANK_LINE);
		REQUIRE(config.renderMode == RenderMode::ANSI);
	}

	SECTION("All Keys") {
		REQUIRE(load_config_from_json_data(R"({"paragraphs": "document", "strip": true})", config)
				== ConfigError::NONE);
		REQUIRE(config.paragraphMode == ParagraphMode::DOCUMENT);
		REQUIRE(config.renderMode == RenderMode::PLAIN);

		REQUIRE(load_config_from_json_data(R"({"strip": false, "paragraphs": "blank-line"})", config)
				== ConfigError::NONE);
		REQUIRE(config.paragraphMode == ParagraphMode::BLANK_LINE);
		REQUIRE(config.renderMode == RenderMode::ANSI);
	}

	SECTION("Unknown Keys Are Ignored") {
		REQUIRE(load_config_from_json_data(R"({"theme": "dark", "strip": true})", config) == ConfigError::NONE);
		REQUIRE(config.renderMode == RenderMode::PLAIN);
	}

	SECTION("Not An Object") {
		REQUIRE(load_config_from_json_data("[1, 2]", config) == ConfigError::INVALID_JSON);
		REQUIRE(load_config_from_json_data("", config) == ConfigError::INVALID_JSON);
	}

	SECTION("Wrong Type") {
		REQUIRE(load_config_from_json_data(R"({"strip": "yes"})", config) == ConfigError::INVALID_JSON);
		REQUIRE(load_config_from_json_data(R"({"paragraphs": 2})", config) == ConfigError::INVALID_JSON);
		REQUIRE(config.renderMode == RenderMode::ANSI);
	}

	SECTION("Unsupported Value Leaves Config Unchanged") {
		REQUIRE(load_config_from_json_data(R"({"strip": true, "paragraphs": "line"})", config)
				== ConfigError::INVALID_VALUE);
		REQUIRE(config.paragraphMode == ParagraphMode::BLANK_LINE);
		REQUIRE(config.renderMode == RenderMode::ANSI);
	}
}

TEST_CASE("Config From JSON File", "[Config]") {
	Config config{};

	SECTION("Missing File") {
		REQUIRE(load_config_from_json_file("this/file/does/not/exist.json", config)
				== ConfigError::FILE_READ_FAILED);
	}

	SECTION("Existing File") {
		auto path = (std::filesystem::temp_directory_path() / "termmark_test_config.json").string();

		FILE* file = std::fopen(path.c_str(), "wb");
		REQUIRE(file);
		std::fputs(R"({"paragraphs": "document"})", file);
		std::fclose(file);

		REQUIRE(load_config_from_json_file(path.c_str(), config) == ConfigError::NONE);
		REQUIRE(config.paragraphMode == ParagraphMode::DOCUMENT);

		std::filesystem::remove(path);
	}
}

TEST_CASE("Config Error Messages", "[Config]") {
	REQUIRE(std::string(get_config_error_message(ConfigError::INVALID_VALUE)).size() > 0);
	REQUIRE(std::string(get_config_error_message(ConfigError::FILE_READ_FAILED)).size() > 0);
}

