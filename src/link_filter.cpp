#include "link_filter.hpp"
#include "link_utils.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace linkcheck {

static HostClass ClassifyIPv4(const unsigned char *addr) {
	if (addr[0] == 127) {
		return HostClass::LOOPBACK;
	}
	if (addr[0] == 10 || (addr[0] == 172 && (addr[1] & 0xF0) == 16) || (addr[0] == 192 && addr[1] == 168)) {
		return HostClass::PRIVATE;
	}
	if (addr[0] == 169 && addr[1] == 254) {
		return HostClass::LINK_LOCAL;
	}
	return HostClass::PUBLIC;
}

HostClass ClassifyHost(const std::string &host) {
	std::string lower = ToLower(host);
	if (lower == "localhost" || EndsWith(lower, ".localhost")) {
		return HostClass::LOOPBACK;
	}

	if (lower.size() > 2 && lower.front() == '[' && lower.back() == ']') {
		std::string literal = lower.substr(1, lower.size() - 2);
		// Zone identifiers ("fe80::1%25eth0") are not part of the address
		size_t zone = literal.find('%');
		if (zone != std::string::npos) {
			literal = literal.substr(0, zone);
		}
		unsigned char addr[16];
		if (inet_pton(AF_INET6, literal.c_str(), addr) != 1) {
			return HostClass::PUBLIC;
		}
		static const unsigned char LOOPBACK6[16] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
		if (std::memcmp(addr, LOOPBACK6, sizeof(addr)) == 0) {
			return HostClass::LOOPBACK;
		}
		// IPv4-mapped ::ffff:a.b.c.d
		static const unsigned char MAPPED_PREFIX[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};
		if (std::memcmp(addr, MAPPED_PREFIX, sizeof(MAPPED_PREFIX)) == 0) {
			return ClassifyIPv4(addr + 12);
		}
		if (addr[0] == 0xFE && (addr[1] & 0xC0) == 0x80) {
			return HostClass::LINK_LOCAL;
		}
		if ((addr[0] & 0xFE) == 0xFC) {
			return HostClass::PRIVATE;
		}
		return HostClass::PUBLIC;
	}

	unsigned char addr[4];
	if (inet_pton(AF_INET, lower.c_str(), addr) == 1) {
		return ClassifyIPv4(addr);
	}
	return HostClass::PUBLIC;
}

static std::vector<std::regex> CompilePatterns(const std::vector<std::string> &patterns) {
	std::vector<std::regex> compiled;
	for (const auto &pattern : patterns) {
		try {
			compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
		} catch (std::regex_error &e) {
			throw ConfigError("Invalid pattern '" + pattern + "': " + e.what());
		}
	}
	return compiled;
}

LinkFilter::LinkFilter(const LinkCheckConfig &config)
    : includes_(CompilePatterns(config.include_patterns)), excludes_(CompilePatterns(config.exclude_patterns)),
      exclude_private_(config.exclude_private), exclude_loopback_(config.exclude_loopback),
      exclude_link_local_(config.exclude_link_local), exclude_mail_(config.exclude_mail) {
	for (const auto &scheme : config.allowed_schemes) {
		schemes_.insert(ToLower(Trim(scheme)));
	}
}

std::string LinkFilter::MatchText(const Target &target) {
	if (target.kind == TargetKind::MAIL_ADDRESS) {
		return "mailto:" + target.uri;
	}
	return target.uri;
}

bool LinkFilter::IsExcluded(const Target &target, SkipReason &reason) const {
	// Policy exclusions come first; include patterns cannot override them
	if (target.kind == TargetKind::MAIL_ADDRESS && exclude_mail_) {
		reason = SkipReason::EXCLUDED_MAIL;
		return true;
	}
	if (target.kind == TargetKind::WEB_URL) {
		if (!schemes_.empty()) {
			size_t colon = target.uri.find(':');
			std::string scheme = colon == std::string::npos ? "" : ToLower(target.uri.substr(0, colon));
			if (schemes_.find(scheme) == schemes_.end()) {
				reason = SkipReason::EXCLUDED_SCHEME;
				return true;
			}
		}
		switch (ClassifyHost(target.host)) {
		case HostClass::PRIVATE:
			if (exclude_private_) {
				reason = SkipReason::PRIVATE_ADDRESS;
				return true;
			}
			break;
		case HostClass::LOOPBACK:
			if (exclude_loopback_) {
				reason = SkipReason::LOOPBACK_ADDRESS;
				return true;
			}
			break;
		case HostClass::LINK_LOCAL:
			if (exclude_link_local_) {
				reason = SkipReason::LINK_LOCAL_ADDRESS;
				return true;
			}
			break;
		default:
			break;
		}
	}

	if (includes_.empty() && excludes_.empty()) {
		return false;
	}
	std::string text = MatchText(target);
	for (const auto &include : includes_) {
		if (std::regex_search(text, include)) {
			return false;
		}
	}
	if (!includes_.empty()) {
		reason = SkipReason::NOT_INCLUDED;
		return true;
	}
	for (const auto &exclude : excludes_) {
		if (std::regex_search(text, exclude)) {
			reason = SkipReason::EXCLUDED_PATTERN;
			return true;
		}
	}
	return false;
}

} // namespace linkcheck
