#include "config.hpp"
#include "document.hpp"
#include "file_read_bytes.hpp"

#include <cstdio>
#include <cstdlib>

#include <getopt.h>
#include <sysexits.h>

using namespace TermMark;

static constexpr const char* VERSION = "termmark 0.1.0";

static constexpr const char* USAGE = "Usage: %s [options] <file>\n";

static constexpr const char* HELP = R"(
Renders *italic*, **bold** and ~~strikethrough~~ markup as ANSI terminal formatting.
Paragraphs are separated by a blank line. Use '-' as <file> to read standard input.

Options:
    -c --config <file>      load settings from a JSON config file
    -d --document           treat the whole input as a single paragraph
    -s --strip              print plain text without escape codes
    -v --version            print version string
    -h --help               display this help and exit
)";

static const struct option g_longOptions[] = {
	{"config", required_argument, nullptr, 'c'},
	{"document", no_argument, nullptr, 'd'},
	{"strip", no_argument, nullptr, 's'},
	{"version", no_argument, nullptr, 'v'},
	{"help", no_argument, nullptr, 'h'},
	{nullptr, 0, nullptr, 0},
};

static void print_usage_error(const char* programName);

int main(int argc, char* argv[]) {
	const char* configFileName = nullptr;
	bool documentMode = false;
	bool strip = false;
	int opt;

	while ((opt = getopt_long(argc, argv, "c:dsvh", g_longOptions, nullptr)) != -1) {
		switch (opt) {
			case 'c':
				configFileName = optarg;
				break;
			case 'd':
				documentMode = true;
				break;
			case 's':
				strip = true;
				break;
			case 'v':
				std::puts(VERSION);
				return EXIT_SUCCESS;
			case 'h':
				std::printf(USAGE, argv[0]);
				std::fputs(HELP, stdout);
				return EXIT_SUCCESS;
			default:
				print_usage_error(argv[0]);
				return EXIT_FAILURE;
		}
	}

	if (optind + 1 != argc) {
		print_usage_error(argv[0]);
		return EXIT_FAILURE;
	}

	Config config{};

	if (configFileName) {
		if (auto res = load_config_from_json_file(configFileName, config); res != ConfigError::NONE) {
			std::fprintf(stderr, "%s: %s\n", configFileName, get_config_error_message(res));
			return EX_CONFIG;
		}
	}

	if (documentMode) {
		config.paragraphMode = ParagraphMode::DOCUMENT;
	}

	if (strip) {
		config.renderMode = RenderMode::PLAIN;
	}

	const char* fileName = argv[optind];
	std::vector<char> fileData;

	if (file_read_bytes(fileName, fileData) != FileReadError::NONE) {
		std::fprintf(stderr, "unable to read file '%s'\n", fileName);
		return EX_UNAVAILABLE;
	}

	auto document = parse_document(std::string_view(fileData.data(), fileData.size()), config.paragraphMode);
	auto output = render_document(document, config.renderMode);

	std::fwrite(output.data(), 1, output.size(), stdout);
	std::putchar('\n');

	return EXIT_SUCCESS;
}

static void print_usage_error(const char* programName) {
	std::fprintf(stderr, USAGE, programName);
	std::fputs("(try using -h or --help for more info)\n", stderr);
}

