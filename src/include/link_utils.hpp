#pragma once

#include <string>
#include <vector>

namespace linkcheck {

//===--------------------------------------------------------------------===//
// String Utilities
//===--------------------------------------------------------------------===//

std::string ToLower(const std::string &str);
std::string Trim(const std::string &str);
bool StartsWith(const std::string &str, const std::string &prefix);
bool EndsWith(const std::string &str, const std::string &suffix);
// Case-insensitive prefix check
bool StartsWithNoCase(const std::string &str, const std::string &prefix);
// Split on delimiter, trimming each piece and dropping empty pieces
std::vector<std::string> SplitAndTrim(const std::string &str, char delimiter);

// Decode %XX escapes. Invalid escapes are kept literally.
std::string PercentDecode(const std::string &str);

// Lower-cased extension including the dot (".md"), empty if none
std::string FileExtension(const std::string &path);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
// A non-zero max_bytes stops inflating at that many output bytes and sets *capped.
std::string DecompressGzip(const std::string &compressed_data, size_t max_bytes = 0, bool *capped = nullptr);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

} // namespace linkcheck
