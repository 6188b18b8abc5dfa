#pragma once

#include "link_config.hpp"
#include "link_types.hpp"
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace linkcheck {

enum class HostClass : uint8_t {
	PUBLIC = 0,
	PRIVATE = 1,
	LOOPBACK = 2,
	LINK_LOCAL = 3
};

// Classifies literal hosts only (IPv4, bracketed IPv6, localhost). Never resolves names.
HostClass ClassifyHost(const std::string &host);

// Exclusion policy applied to resolved targets before any network access
class LinkFilter {
public:
	// Throws ConfigError for invalid patterns
	explicit LinkFilter(const LinkCheckConfig &config);

	// True when the target must not be checked; reason says why
	bool IsExcluded(const Target &target, SkipReason &reason) const;

	// Text the include/exclude patterns are matched against
	static std::string MatchText(const Target &target);

private:
	std::vector<std::regex> includes_;
	std::vector<std::regex> excludes_;
	std::set<std::string> schemes_;
	bool exclude_private_;
	bool exclude_loopback_;
	bool exclude_link_local_;
	bool exclude_mail_;
};

} // namespace linkcheck
