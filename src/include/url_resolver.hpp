#pragma once

#include "link_config.hpp"
#include "link_filter.hpp"
#include "link_types.hpp"
#include <string>
#include <vector>

namespace linkcheck {

// Generic URI split into RFC 3986 components
struct ParsedUrl {
	std::string scheme;     // lower-cased
	bool has_authority = false;
	std::string userinfo;
	std::string host;       // lower-cased, brackets kept for IPv6
	std::string port;
	std::string path;
	bool has_query = false;
	std::string query;
	bool has_fragment = false;
	std::string fragment;

	// False when text has no scheme
	static bool Parse(const std::string &text, ParsedUrl &result);
	std::string ToString(bool with_fragment = true) const;
};

// A RawLink resolves to exactly one of a Target or a SkipVerdict
struct Resolution {
	bool is_target = false;
	Target target;
	SkipVerdict skip;
};

class UrlResolver {
public:
	// Throws ConfigError for invalid filter patterns
	explicit UrlResolver(const LinkCheckConfig &config);

	Resolution Resolve(const RawLink &link, const std::string &base) const;

	// RFC 3986 reference resolution against an absolute base URL
	static std::string ResolveUrl(const std::string &base_url, const std::string &reference);

	// Remove "." and ".." segments; result always starts with '/'
	static std::string NormalizePath(const std::string &path);

	// "scheme://..." or "scheme:..." with a scheme of two or more characters
	static bool HasScheme(const std::string &text);
	static bool IsUrl(const std::string &text);

private:
	Resolution ResolveWeb(const RawLink &link, const std::string &url) const;
	Resolution ResolveFile(const RawLink &link, const std::string &path, const std::string &fragment) const;
	Resolution ResolveRelativeFile(const RawLink &link, const std::string &reference, const std::string &base) const;
	Resolution Finish(Target target) const;
	bool WithinAllowedRoots(const std::string &path) const;

	LinkFilter filter_;
	bool check_anchors_;
	std::string root_dir_;
	std::vector<std::string> allowed_roots_;
};

} // namespace linkcheck
