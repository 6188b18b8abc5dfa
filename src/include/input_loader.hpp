#pragma once

#include "http_client.hpp"
#include "link_config.hpp"
#include "link_types.hpp"
#include <string>
#include <vector>

namespace linkcheck {

enum class InputKind : uint8_t {
	FILE_PATH = 0,
	GLOB = 1,
	URL = 2,
	INLINE = 3
};

struct InputSpec {
	InputKind kind = InputKind::FILE_PATH;
	std::string value;              // path, pattern, URL or raw content
	bool has_format = false;        // overrides format inference
	DocumentFormat format = DocumentFormat::PLAINTEXT;
	std::string base;               // INLINE only: base for relative links
	std::string id;                 // INLINE only: document id (default "<inline>")

	// URL for http(s)://, GLOB when the string has *, ? or [, else a file path
	static InputSpec Classify(const std::string &input);
	static InputSpec Inline(const std::string &content, DocumentFormat format, const std::string &base = "");
};

class InputLoader {
public:
	InputLoader(const LinkCheckConfig &config, HttpTransport &transport);

	// Throws InputError for unreadable files and failed fetches
	std::vector<Document> Load(const std::vector<InputSpec> &inputs);

	Document LoadFile(const std::string &path, const InputSpec &spec);
	Document LoadUrl(const std::string &url, const InputSpec &spec);

	// Sorted glob() matches; directories are walked for documents
	static std::vector<std::string> ExpandGlob(const std::string &pattern);
	// Markdown and HTML files below dir, sorted
	static std::vector<std::string> WalkDirectory(const std::string &dir);

private:
	void Truncate(Document &doc) const;

	const LinkCheckConfig &config_;
	HttpTransport &transport_;
};

} // namespace linkcheck
