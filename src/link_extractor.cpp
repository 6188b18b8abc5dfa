#include "link_extractor.hpp"
#include "link_utils.hpp"
#include "logger.hpp"
#include "text_scanner.hpp"

#include <md4c.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <limits>
#include <map>
#include <unordered_map>

namespace linkcheck {

//===--------------------------------------------------------------------===//
// Helpers
//===--------------------------------------------------------------------===//

// GitHub dialect: tables, strikethrough, task lists and permissive autolinks for bare URLs
static constexpr unsigned MARKDOWN_FLAGS = MD_DIALECT_GITHUB;

// Longest raw tag looked at when pulling attributes out of inline HTML
static constexpr size_t MAX_TAG_BYTES = 8192;

// Locate attr="value" inside a tag. Handles double, single and no quotes.
static bool FindAttribute(const std::string &tag, const std::string &attr, size_t &value_pos, std::string &value) {
	std::string lower_tag = ToLower(tag);
	size_t pos = lower_tag.find(attr);
	while (pos != std::string::npos) {
		// Must not be the tail of another attribute name
		if (pos > 0 && (std::isalnum(static_cast<unsigned char>(lower_tag[pos - 1])) || lower_tag[pos - 1] == '-')) {
			pos = lower_tag.find(attr, pos + 1);
			continue;
		}
		size_t eq_pos = pos + attr.length();
		while (eq_pos < tag.length() && std::isspace(static_cast<unsigned char>(tag[eq_pos]))) {
			eq_pos++;
		}
		if (eq_pos >= tag.length() || tag[eq_pos] != '=') {
			pos = lower_tag.find(attr, pos + 1);
			continue;
		}
		eq_pos++;
		while (eq_pos < tag.length() && std::isspace(static_cast<unsigned char>(tag[eq_pos]))) {
			eq_pos++;
		}
		if (eq_pos >= tag.length()) {
			return false;
		}
		char quote = tag[eq_pos];
		if (quote == '"' || quote == '\'') {
			size_t value_end = tag.find(quote, eq_pos + 1);
			if (value_end == std::string::npos) {
				return false;
			}
			value_pos = eq_pos + 1;
			value = tag.substr(value_pos, value_end - value_pos);
			return true;
		}
		size_t value_end = eq_pos;
		while (value_end < tag.length() && !std::isspace(static_cast<unsigned char>(tag[value_end])) &&
		       tag[value_end] != '>') {
			value_end++;
		}
		value_pos = eq_pos;
		value = tag.substr(eq_pos, value_end - eq_pos);
		return true;
	}
	return false;
}

// Tag name at text[pos] == '<', lower-cased; empty for closing tags and non-tags
static std::string TagName(const std::string &text, size_t pos) {
	size_t i = pos + 1;
	if (i >= text.size() || !std::isalpha(static_cast<unsigned char>(text[i]))) {
		return "";
	}
	size_t start = i;
	while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '-')) {
		i++;
	}
	if (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])) && text[i] != '>' && text[i] != '/') {
		return "";
	}
	return ToLower(text.substr(start, i - start));
}

// Position of needle in text[begin, end), or end
static size_t FindIn(const std::string &text, const char *needle, size_t begin, size_t end) {
	size_t len = std::char_traits<char>::length(needle);
	auto it = std::search(text.begin() + begin, text.begin() + end, needle, needle + len);
	return static_cast<size_t>(it - text.begin());
}

// True when [text, text + size) lies inside content's buffer
static bool PointsInto(const std::string &content, const MD_CHAR *text, MD_SIZE size) {
	std::less<const char *> before;
	const char *data = content.data();
	return text && !before(text, data) && !before(data + content.size(), text + size);
}

// Raw HTML handed over by md4c, either inline tags or HTML block lines.
// Tags may continue past a block line, so scanning resumes after the last '>' seen.
class RawHtmlScanner {
public:
	using TagCallback = std::function<void(size_t tag_begin, const std::string &name, const std::string &tag)>;

	explicit RawHtmlScanner(const std::string &content) : content_(content) {
	}

	void Scan(size_t begin, size_t end, const TagCallback &on_tag) {
		size_t pos = std::max(begin, resume_);
		while (pos < end) {
			if (in_comment_) {
				size_t close = FindIn(content_, "-->", pos, end);
				if (close == end) {
					return;
				}
				in_comment_ = false;
				pos = close + 3;
				continue;
			}
			pos = FindIn(content_, "<", pos, end);
			if (pos == end) {
				return;
			}
			if (content_.compare(pos, 4, "<!--") == 0) {
				in_comment_ = true;
				pos += 4;
				continue;
			}
			std::string name = TagName(content_, pos);
			if (name.empty()) {
				pos++;
				continue;
			}
			// A '<' before the closing '>' means this was not a tag
			size_t limit = std::min(content_.size(), pos + MAX_TAG_BYTES);
			size_t close = content_.find_first_of("<>", pos + 1);
			if (close == std::string::npos || close >= limit || content_[close] != '>') {
				pos++;
				continue;
			}
			on_tag(pos, name, content_.substr(pos, close - pos + 1));
			resume_ = close + 1;
			pos = close + 1;
		}
	}

	void EndBlock() {
		in_comment_ = false;
	}

private:
	const std::string &content_;
	size_t resume_ = 0;
	bool in_comment_ = false;
};

// Runs md4c over content and forwards its callbacks to the handler's On* members
template <class HANDLER>
static bool ParseMarkdown(const std::string &content, HANDLER &handler) {
	if (content.size() > std::numeric_limits<MD_SIZE>::max()) {
		Logger::Warn("Markdown document of " + std::to_string(content.size()) + " bytes is too large to parse");
		return false;
	}
	MD_PARSER parser = {};
	parser.abi_version = 0;
	parser.flags = MARKDOWN_FLAGS;
	parser.enter_block = [](MD_BLOCKTYPE type, void *detail, void *userdata) {
		return static_cast<HANDLER *>(userdata)->OnEnterBlock(type, detail);
	};
	parser.leave_block = [](MD_BLOCKTYPE type, void *detail, void *userdata) {
		return static_cast<HANDLER *>(userdata)->OnLeaveBlock(type, detail);
	};
	parser.enter_span = [](MD_SPANTYPE type, void *detail, void *userdata) {
		return static_cast<HANDLER *>(userdata)->OnEnterSpan(type, detail);
	};
	parser.leave_span = [](MD_SPANTYPE type, void *detail, void *userdata) {
		return static_cast<HANDLER *>(userdata)->OnLeaveSpan(type, detail);
	};
	parser.text = [](MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size, void *userdata) {
		return static_cast<HANDLER *>(userdata)->OnText(type, text, size);
	};
	parser.debug_log = nullptr;
	parser.syntax = nullptr;
	return md_parse(content.data(), static_cast<MD_SIZE>(content.size()), &parser, &handler) == 0;
}

//===--------------------------------------------------------------------===//
// Markdown
//===--------------------------------------------------------------------===//

// Collects links from md4c spans and bare URLs from the prose runs between them.
// md4c hands out pointers into the source buffer for plain text and for attributes
// without escapes or entities; everything else is placed at the start of its construct.
class MarkdownLinkCollector {
public:
	explicit MarkdownLinkCollector(const std::string &content) : content_(content), html_(content) {
	}

	int OnEnterBlock(MD_BLOCKTYPE, void *) {
		FlushProse();
		return 0;
	}

	int OnLeaveBlock(MD_BLOCKTYPE type, void *) {
		FlushProse();
		if (type == MD_BLOCK_HTML) {
			html_.EndBlock();
		}
		return 0;
	}

	int OnEnterSpan(MD_SPANTYPE type, void *detail) {
		FlushProse();
		if (type == MD_SPAN_A) {
			auto *d = static_cast<MD_SPAN_A_DETAIL *>(detail);
			open_.push_back(OpenLink());
			open_.back().autolink = d->is_autolink != 0;
			Place(open_.back(), d->href, LinkKind::MARKDOWN_INLINE);
		} else if (type == MD_SPAN_IMG) {
			auto *d = static_cast<MD_SPAN_IMG_DETAIL *>(detail);
			open_.push_back(OpenLink());
			Place(open_.back(), d->src, LinkKind::MARKDOWN_IMAGE);
		}
		return 0;
	}

	int OnLeaveSpan(MD_SPANTYPE type, void *) {
		FlushProse();
		if ((type != MD_SPAN_A && type != MD_SPAN_IMG) || open_.empty()) {
			return 0;
		}
		OpenLink link = std::move(open_.back());
		open_.pop_back();
		if (!open_.empty() && link.text_begin != std::string::npos) {
			auto &parent = open_.back();
			parent.text_begin = std::min(parent.text_begin, link.text_begin);
			parent.text_end = parent.text_end == std::string::npos ? link.text_end
			                                                       : std::max(parent.text_end, link.text_end);
		}
		Emit(link);
		return 0;
	}

	int OnText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size) {
		if (!InSource(text, size)) {
			FlushProse();
			return 0;
		}
		size_t begin = static_cast<size_t>(text - content_.data());
		size_t end = begin + size;
		cursor_ = end;
		if (type == MD_TEXT_HTML) {
			FlushProse();
			ScanHtml(begin, end);
			return 0;
		}
		if (!open_.empty()) {
			auto &link = open_.back();
			if (link.text_begin == std::string::npos) {
				link.text_begin = begin;
			}
			link.text_end = end;
			return 0;
		}
		if (type != MD_TEXT_NORMAL) {
			FlushProse();
			return 0;
		}
		// md4c splits prose at escapes and emphasis; adjacent pieces are scanned together
		if (prose_begin_ != std::string::npos && begin == prose_end_) {
			prose_end_ = end;
		} else {
			FlushProse();
			prose_begin_ = begin;
			prose_end_ = end;
		}
		return 0;
	}

	std::vector<RawLink> TakeLinks() {
		FlushProse();
		return std::move(links_);
	}

private:
	struct OpenLink {
		std::string destination;
		size_t offset = std::string::npos;
		LinkKind kind = LinkKind::MARKDOWN_INLINE;
		bool autolink = false;
		// Source range of the label text seen so far
		size_t text_begin = std::string::npos;
		size_t text_end = std::string::npos;
	};

	bool InSource(const MD_CHAR *text, MD_SIZE size) const {
		return PointsInto(content_, text, size);
	}

	// True when the destination at pos follows "(" or "(<", as in [t](dest)
	bool IsInlineDestination(size_t pos) {
		auto cached = inline_destinations_.find(pos);
		if (cached != inline_destinations_.end()) {
			return cached->second;
		}
		size_t i = pos;
		if (i > 0 && content_[i - 1] == '<') {
			i--;
		}
		while (i > 0 && std::isspace(static_cast<unsigned char>(content_[i - 1]))) {
			i--;
		}
		bool is_inline = i > 0 && content_[i - 1] == '(';
		inline_destinations_[pos] = is_inline;
		return is_inline;
	}

	// Destination text and, where md4c points into the source, its offset and kind
	void Place(OpenLink &link, const MD_ATTRIBUTE &attribute, LinkKind kind) {
		link.kind = kind;
		if (!attribute.text || attribute.size == 0) {
			return;
		}
		link.destination.assign(attribute.text, attribute.size);
		if (link.autolink || !InSource(attribute.text, attribute.size)) {
			return;
		}
		size_t pos = static_cast<size_t>(attribute.text - content_.data());
		if (IsInlineDestination(pos)) {
			link.offset = pos;
		} else if (kind == LinkKind::MARKDOWN_INLINE) {
			// Points at a "[label]: dest" definition elsewhere in the document
			link.kind = LinkKind::MARKDOWN_REFERENCE;
		}
	}

	void Emit(OpenLink &link) {
		RawLink raw;
		if (link.autolink) {
			if (link.text_begin != std::string::npos) {
				raw.text = content_.substr(link.text_begin, link.text_end - link.text_begin);
				raw.offset = link.text_begin;
			} else {
				raw.text = link.destination;
				raw.offset = cursor_;
			}
			if (raw.offset > 0 && content_[raw.offset - 1] == '<') {
				raw.kind = LinkKind::MARKDOWN_AUTOLINK;
			} else if (raw.text.find('@') != std::string::npos && raw.text.find("://") == std::string::npos) {
				raw.kind = LinkKind::BARE_MAIL;
			} else {
				raw.kind = LinkKind::BARE_URL;
			}
		} else {
			if (link.destination.empty()) {
				return;
			}
			raw.text = std::move(link.destination);
			raw.kind = link.kind;
			raw.offset = link.offset != std::string::npos ? link.offset : ConstructStart(link);
		}
		if (!raw.text.empty()) {
			links_.push_back(std::move(raw));
		}
	}

	// Opening '[' of a link whose destination has no position of its own
	size_t ConstructStart(const OpenLink &link) const {
		if (link.text_begin != std::string::npos) {
			size_t open = content_.rfind('[', link.text_begin);
			return open == std::string::npos ? link.text_begin : open;
		}
		size_t open = content_.find('[', cursor_);
		return open == std::string::npos ? cursor_ : open;
	}

	void ScanHtml(size_t begin, size_t end) {
		html_.Scan(begin, end, [&](size_t tag_begin, const std::string &, const std::string &tag) {
			static const std::pair<const char *, LinkKind> ATTRIBUTES[] = {{"href", LinkKind::HTML_HREF},
			                                                               {"src", LinkKind::HTML_SRC}};
			for (const auto &attribute : ATTRIBUTES) {
				size_t value_pos;
				std::string value;
				if (FindAttribute(tag, attribute.first, value_pos, value) && !Trim(value).empty()) {
					RawLink link;
					link.text = Trim(value);
					link.offset = tag_begin + value_pos;
					link.kind = attribute.second;
					links_.push_back(std::move(link));
				}
			}
		});
	}

	void FlushProse() {
		if (prose_begin_ == std::string::npos) {
			return;
		}
		ScanBareLinks(content_, prose_begin_, prose_end_, links_);
		prose_begin_ = std::string::npos;
	}

	const std::string &content_;
	RawHtmlScanner html_;
	std::vector<RawLink> links_;
	std::vector<OpenLink> open_;
	std::unordered_map<size_t, bool> inline_destinations_;
	size_t prose_begin_ = std::string::npos;
	size_t prose_end_ = 0;
	// End of the last source text md4c reported
	size_t cursor_ = 0;
};

std::vector<RawLink> LinkExtractor::ExtractMarkdownLinks(const std::string &content) {
	MarkdownLinkCollector collector(content);
	if (!ParseMarkdown(content, collector)) {
		Logger::Warn("Markdown parsing stopped early; later links in the document are not reported");
	}
	auto links = collector.TakeLinks();
	FinalizeLinks(content, links);
	return links;
}

//===--------------------------------------------------------------------===//
// Plain text
//===--------------------------------------------------------------------===//

std::vector<RawLink> LinkExtractor::ExtractTextLinks(const std::string &content) {
	std::vector<RawLink> links;
	ScanBareLinks(content, 0, content.size(), links);
	FinalizeLinks(content, links);
	return links;
}

//===--------------------------------------------------------------------===//
// Dispatch
//===--------------------------------------------------------------------===//

std::vector<RawLink> LinkExtractor::ExtractLinks(const Document &doc) {
	switch (doc.format) {
	case DocumentFormat::MARKDOWN:
		return ExtractMarkdownLinks(doc.content);
	case DocumentFormat::HTML:
		return ExtractHtmlLinks(doc.content);
	case DocumentFormat::PLAINTEXT:
	default:
		return ExtractTextLinks(doc.content);
	}
}

std::set<std::string> LinkExtractor::ExtractAnchors(const Document &doc) {
	switch (doc.format) {
	case DocumentFormat::MARKDOWN:
		return ExtractMarkdownAnchors(doc.content);
	case DocumentFormat::HTML:
		return ExtractHtmlAnchors(doc.content);
	case DocumentFormat::PLAINTEXT:
	default:
		return {};
	}
}

DocumentFormat LinkExtractor::InferFormat(const std::string &path_or_url, const std::string &content_type) {
	std::string path = path_or_url;
	size_t cut = path.find_first_of("?#");
	if (cut != std::string::npos && path.find("://") != std::string::npos) {
		path = path.substr(0, cut);
	}
	std::string ext = FileExtension(path);
	if (ext == ".md" || ext == ".markdown" || ext == ".mkd" || ext == ".mdx") {
		return DocumentFormat::MARKDOWN;
	}
	if (ext == ".html" || ext == ".htm" || ext == ".xhtml") {
		return DocumentFormat::HTML;
	}
	std::string type = ToLower(content_type);
	if (type.find("text/html") != std::string::npos || type.find("application/xhtml") != std::string::npos) {
		return DocumentFormat::HTML;
	}
	if (type.find("text/markdown") != std::string::npos || type.find("text/x-markdown") != std::string::npos) {
		return DocumentFormat::MARKDOWN;
	}
	return DocumentFormat::PLAINTEXT;
}

//===--------------------------------------------------------------------===//
// Anchors
//===--------------------------------------------------------------------===//

std::string LinkExtractor::Slugify(const std::string &heading) {
	std::string slug;
	for (size_t i = 0; i < heading.size(); i++) {
		unsigned char c = static_cast<unsigned char>(heading[i]);
		// [label](dest) contributes its label only
		if (c == ']' && i + 1 < heading.size() && heading[i + 1] == '(') {
			size_t close = heading.find(')', i + 1);
			if (close != std::string::npos) {
				i = close;
				continue;
			}
		}
		if (std::isalnum(c) || c >= 0x80 || c == '_' || c == '-') {
			slug += static_cast<char>(std::tolower(c));
		} else if (c == ' ') {
			slug += '-';
		}
	}
	return slug;
}

// Strips a trailing "{#id}" from heading text, returning the id
static std::string TakeExplicitId(std::string &heading) {
	std::string trimmed = Trim(heading);
	if (!EndsWith(trimmed, "}")) {
		return "";
	}
	size_t open = trimmed.rfind("{#");
	if (open == std::string::npos) {
		return "";
	}
	std::string id = trimmed.substr(open + 2, trimmed.size() - open - 3);
	heading = Trim(trimmed.substr(0, open));
	return Trim(id);
}


// Heading text as md4c renders it plus ids from raw HTML
class MarkdownAnchorCollector {
public:
	explicit MarkdownAnchorCollector(const std::string &content) : content_(content), html_(content) {
	}

	int OnEnterBlock(MD_BLOCKTYPE type, void *) {
		if (type == MD_BLOCK_H) {
			in_heading_ = true;
			heading_.clear();
		}
		return 0;
	}

	int OnLeaveBlock(MD_BLOCKTYPE type, void *) {
		if (type == MD_BLOCK_H) {
			AddHeading(heading_);
			in_heading_ = false;
		} else if (type == MD_BLOCK_HTML) {
			html_.EndBlock();
		}
		return 0;
	}

	int OnEnterSpan(MD_SPANTYPE, void *) {
		return 0;
	}

	int OnLeaveSpan(MD_SPANTYPE, void *) {
		return 0;
	}

	int OnText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size) {
		switch (type) {
		case MD_TEXT_HTML: {
			if (PointsInto(content_, text, size)) {
				size_t begin = static_cast<size_t>(text - content_.data());
				html_.Scan(begin, begin + size, [&](size_t, const std::string &name, const std::string &tag) {
					size_t value_pos;
					std::string value;
					if (FindAttribute(tag, "id", value_pos, value) && !value.empty()) {
						anchors_.insert(value);
					}
					if (name == "a" && FindAttribute(tag, "name", value_pos, value) && !value.empty()) {
						anchors_.insert(value);
					}
				});
			}
			break;
		}
		case MD_TEXT_NORMAL:
		case MD_TEXT_CODE:
			if (in_heading_) {
				heading_.append(text, size);
			}
			break;
		case MD_TEXT_SOFTBR:
		case MD_TEXT_BR:
			if (in_heading_) {
				heading_ += ' ';
			}
			break;
		default:
			break;
		}
		return 0;
	}

	std::set<std::string> TakeAnchors() {
		return std::move(anchors_);
	}

private:
	void AddHeading(std::string heading) {
		std::string explicit_id = TakeExplicitId(heading);
		if (!explicit_id.empty()) {
			anchors_.insert(explicit_id);
		}
		std::string slug = LinkExtractor::Slugify(Trim(heading));
		int &count = slug_counts_[slug];
		anchors_.insert(count == 0 ? slug : slug + "-" + std::to_string(count));
		count++;
	}

	const std::string &content_;
	RawHtmlScanner html_;
	std::set<std::string> anchors_;
	std::map<std::string, int> slug_counts_;
	std::string heading_;
	bool in_heading_ = false;
};

std::set<std::string> LinkExtractor::ExtractMarkdownAnchors(const std::string &content) {
	MarkdownAnchorCollector collector(content);
	if (!ParseMarkdown(content, collector)) {
		Logger::Warn("Markdown parsing stopped early; later headings in the document are not indexed");
	}
	return collector.TakeAnchors();
}

} // namespace linkcheck
