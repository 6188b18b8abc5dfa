#include "link_utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace linkcheck {

//===--------------------------------------------------------------------===//
// String Utilities
//===--------------------------------------------------------------------===//

std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

std::string Trim(const std::string &str) {
	size_t start = 0;
	size_t end = str.length();
	while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

bool StartsWith(const std::string &str, const std::string &prefix) {
	return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string &str, const std::string &suffix) {
	return str.size() >= suffix.size() &&
	       str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWithNoCase(const std::string &str, const std::string &prefix) {
	if (str.size() < prefix.size()) {
		return false;
	}
	for (size_t i = 0; i < prefix.size(); i++) {
		if (std::tolower(static_cast<unsigned char>(str[i])) !=
		    std::tolower(static_cast<unsigned char>(prefix[i]))) {
			return false;
		}
	}
	return true;
}

std::vector<std::string> SplitAndTrim(const std::string &str, char delimiter) {
	std::vector<std::string> parts;
	size_t pos = 0;
	while (pos <= str.size()) {
		size_t next = str.find(delimiter, pos);
		if (next == std::string::npos) {
			next = str.size();
		}
		std::string part = Trim(str.substr(pos, next - pos));
		if (!part.empty()) {
			parts.push_back(part);
		}
		pos = next + 1;
	}
	return parts;
}

static int HexValue(char c) {
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::string PercentDecode(const std::string &str) {
	std::string result;
	result.reserve(str.size());
	for (size_t i = 0; i < str.size(); i++) {
		if (str[i] == '%' && i + 2 < str.size()) {
			int hi = HexValue(str[i + 1]);
			int lo = HexValue(str[i + 2]);
			if (hi >= 0 && lo >= 0) {
				result += static_cast<char>(hi * 16 + lo);
				i += 2;
				continue;
			}
		}
		result += str[i];
	}
	return result;
}

std::string FileExtension(const std::string &path) {
	size_t slash = path.find_last_of("/\\");
	size_t dot = path.rfind('.');
	if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
		return "";
	}
	return ToLower(path.substr(dot));
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data, size_t max_bytes, bool *capped) {
	if (capped) {
		*capped = false;
	}
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// 16 + MAX_WBITS selects the gzip wrapper
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		if (max_bytes > 0 && decompressed.size() + have >= max_bytes) {
			decompressed.append(buffer, max_bytes - decompressed.size());
			if (capped && (ret != Z_STREAM_END || zs.avail_out == 0)) {
				*capped = true;
			}
			inflateEnd(&zs);
			return decompressed;
		}
		decompressed.append(buffer, have);

		// Truncated input: no progress possible
		if (ret == Z_BUF_ERROR && zs.avail_in == 0) {
			inflateEnd(&zs);
			return "";
		}
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

} // namespace linkcheck
