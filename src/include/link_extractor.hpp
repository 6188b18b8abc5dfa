#pragma once

#include "link_types.hpp"
#include <set>
#include <string>
#include <vector>

namespace linkcheck {

class LinkExtractor {
public:
	// Extract every link-like reference in document order. Never throws for content.
	static std::vector<RawLink> ExtractLinks(const Document &doc);

	static std::vector<RawLink> ExtractMarkdownLinks(const std::string &content);
	static std::vector<RawLink> ExtractHtmlLinks(const std::string &content);
	static std::vector<RawLink> ExtractTextLinks(const std::string &content);

	// Anchor names a fragment may refer to (heading slugs, id and name attributes)
	static std::set<std::string> ExtractAnchors(const Document &doc);
	static std::set<std::string> ExtractMarkdownAnchors(const std::string &content);
	static std::set<std::string> ExtractHtmlAnchors(const std::string &content);

	// GitHub-style heading slug: lower-cased, punctuation dropped, spaces to '-'
	static std::string Slugify(const std::string &heading);

	// Format from file extension, falling back to the Content-Type header
	static DocumentFormat InferFormat(const std::string &path_or_url, const std::string &content_type = "");
};

} // namespace linkcheck
