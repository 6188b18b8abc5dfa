#include "text_scanner.hpp"
#include "link_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>

namespace linkcheck {

//===--------------------------------------------------------------------===//
// LineIndex
//===--------------------------------------------------------------------===//

LineIndex::LineIndex(const std::string &content) : size_(content.size()) {
	line_starts_.push_back(0);
	for (size_t i = 0; i < content.size(); i++) {
		if (content[i] == '\n') {
			line_starts_.push_back(i + 1);
		}
	}
}

size_t LineIndex::LineOf(size_t offset) const {
	auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
	return static_cast<size_t>(it - line_starts_.begin());
}

size_t LineIndex::ColumnOf(size_t offset) const {
	size_t line = LineOf(offset);
	return offset - line_starts_[line - 1] + 1;
}

size_t LineIndex::LineStart(size_t line) const {
	if (line == 0) {
		return 0;
	}
	if (line > line_starts_.size()) {
		return size_;
	}
	return line_starts_[line - 1];
}

//===--------------------------------------------------------------------===//
// Bare URL / mail scanning
//===--------------------------------------------------------------------===//

static const char *URL_PREFIXES[] = {"https://", "http://", "ftp://", "file://", "mailto:", "www."};

static bool IsUrlTerminator(unsigned char c) {
	return std::isspace(c) || c == '<' || c == '>' || c == '"' || c == '`' || c == '{' || c == '}' ||
	       c == '|' || c == '\\' || c == '^' || c < 0x20;
}

static bool IsWordChar(unsigned char c) {
	return std::isalnum(c) || c == '_' || c >= 0x80;
}

static bool IsMailLocalChar(unsigned char c) {
	return std::isalnum(c) || (c != '\0' && std::strchr(".!#$%&'*+/=?^_`{|}~-", c) != nullptr);
}

static bool IsMailDomainChar(unsigned char c) {
	return std::isalnum(c) || c == '.' || c == '-';
}

// Drops trailing sentence punctuation and closing brackets without an opening partner
static size_t TrimUrlEnd(const std::string &text, size_t begin, size_t end) {
	long parens = 0;
	long brackets = 0;
	for (size_t i = begin; i < end; i++) {
		char c = text[i];
		parens += c == '(' ? 1 : c == ')' ? -1 : 0;
		brackets += c == '[' ? 1 : c == ']' ? -1 : 0;
	}
	while (end > begin) {
		char c = text[end - 1];
		if (c != '\0' && std::strchr(".,;:!?'*", c)) {
			end--;
			continue;
		}
		if (c == ')' && parens < 0) {
			parens++;
			end--;
			continue;
		}
		if (c == ']' && brackets < 0) {
			brackets++;
			end--;
			continue;
		}
		break;
	}
	return end;
}

static size_t MatchUrlPrefix(const std::string &text, size_t pos, size_t end) {
	for (const char *prefix : URL_PREFIXES) {
		size_t len = std::strlen(prefix);
		if (pos + len > end) {
			continue;
		}
		bool match = true;
		for (size_t i = 0; i < len; i++) {
			if (std::tolower(static_cast<unsigned char>(text[pos + i])) != prefix[i]) {
				match = false;
				break;
			}
		}
		if (match) {
			return len;
		}
	}
	return 0;
}

void ScanBareLinks(const std::string &text, size_t begin, size_t end, std::vector<RawLink> &links) {
	end = std::min(end, text.size());
	// URL spans in increasing order; mail candidates are checked against them with a moving cursor
	std::vector<std::pair<size_t, size_t>> found;

	// URLs first, so that mail-shaped userinfo inside them is not reported twice
	size_t pos = begin;
	while (pos < end) {
		unsigned char prev = pos > begin ? static_cast<unsigned char>(text[pos - 1]) : ' ';
		size_t prefix_len = IsWordChar(prev) ? 0 : MatchUrlPrefix(text, pos, end);
		if (prefix_len == 0) {
			pos++;
			continue;
		}
		size_t stop = pos + prefix_len;
		while (stop < end && !IsUrlTerminator(static_cast<unsigned char>(text[stop]))) {
			stop++;
		}
		stop = TrimUrlEnd(text, pos, stop);
		if (stop > pos + prefix_len) {
			RawLink link;
			link.text = text.substr(pos, stop - pos);
			link.offset = pos;
			link.kind = StartsWithNoCase(link.text, "mailto:") ? LinkKind::BARE_MAIL : LinkKind::BARE_URL;
			links.push_back(std::move(link));
			found.emplace_back(pos, stop);
		}
		pos = std::max(stop, pos + prefix_len);
	}

	size_t next_found = 0;
	pos = begin;
	while (pos < end) {
		size_t at = static_cast<size_t>(std::find(text.begin() + pos, text.begin() + end, '@') - text.begin());
		if (at >= end) {
			break;
		}
		size_t local_begin = at;
		while (local_begin > begin && IsMailLocalChar(static_cast<unsigned char>(text[local_begin - 1]))) {
			local_begin--;
		}
		while (local_begin < at && !std::isalnum(static_cast<unsigned char>(text[local_begin]))) {
			local_begin++;
		}
		size_t domain_end = at + 1;
		while (domain_end < end && IsMailDomainChar(static_cast<unsigned char>(text[domain_end]))) {
			domain_end++;
		}
		while (domain_end > at + 1 && (text[domain_end - 1] == '.' || text[domain_end - 1] == '-')) {
			domain_end--;
		}
		std::string domain = text.substr(at + 1, domain_end - at - 1);
		bool shaped = local_begin < at && domain.find('.') != std::string::npos && domain[0] != '.';
		while (next_found < found.size() && found[next_found].second <= local_begin) {
			next_found++;
		}
		bool inside_url = next_found < found.size() && found[next_found].first < domain_end;
		if (shaped && !inside_url) {
			RawLink link;
			link.text = text.substr(local_begin, domain_end - local_begin);
			link.offset = local_begin;
			link.kind = LinkKind::BARE_MAIL;
			links.push_back(std::move(link));
		}
		pos = std::max(domain_end, at + 1);
	}
}

void FinalizeLinks(const std::string &content, std::vector<RawLink> &links) {
	std::stable_sort(links.begin(), links.end(),
	                 [](const RawLink &a, const RawLink &b) { return a.offset < b.offset; });
	LineIndex index(content);
	for (size_t i = 0; i < links.size(); i++) {
		links[i].index = i;
		index.Locate(links[i]);
	}
}

} // namespace linkcheck
