#pragma once

#include <vector>

#include <cstdio>
#include <cstddef>
#include <cstring>

namespace TermMark {

enum class FileReadError {
	NONE,
	OPEN_FAILED,
	READ_FAILED,
};

/**
 * Reads the whole file into `result`. A file name of "-" reads standard input until end of file.
 * On failure `result` is left empty.
 */
[[nodiscard]] inline FileReadError file_read_bytes(const char* fileName, std::vector<char>& result) {
	result.clear();

	bool useStdin = std::strcmp(fileName, "-") == 0;
	FILE* file = useStdin ? stdin : std::fopen(fileName, "rb");

	if (!file) {
		return FileReadError::OPEN_FAILED;
	}

	// Read in chunks, pipes and special files cannot report their size up front
	char buffer[4096];
	size_t count;

	while ((count = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
		result.insert(result.end(), buffer, buffer + count);
	}

	bool failed = std::ferror(file) != 0;

	if (!useStdin) {
		std::fclose(file);
	}

	if (failed) {
		result.clear();
		return FileReadError::READ_FAILED;
	}

	return FileReadError::NONE;
}

}

