#include "link_extractor.hpp"
#include "link_utils.hpp"
#include "text_scanner.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <algorithm>
#include <cctype>
#include <functional>

namespace linkcheck {

// RAII wrapper for xmlDoc
class XmlDocGuard {
public:
	explicit XmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~XmlDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	XmlDocGuard(const XmlDocGuard &) = delete;
	XmlDocGuard &operator=(const XmlDocGuard &) = delete;

	xmlDocPtr get() const { return doc_; }
	operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

static XmlDocGuard ParseHtml(const std::string &html) {
	return XmlDocGuard(htmlReadMemory(
		html.c_str(),
		static_cast<int>(html.size()),
		nullptr,     // URL
		"UTF-8",     // encoding
		HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
	));
}

// Helper: get attribute value from xmlNode
static std::string GetAttribute(xmlNodePtr node, const char *attr) {
	xmlChar *value = xmlGetProp(node, BAD_CAST attr);
	if (!value) {
		return "";
	}
	std::string result(reinterpret_cast<const char *>(value));
	xmlFree(value);
	return result;
}

static bool NameIs(xmlNodePtr node, const char *name) {
	return xmlStrcasecmp(node->name, BAD_CAST name) == 0;
}

// First URL of a srcset list ("a.png 1x, b.png 2x")
static std::string FirstSrcsetCandidate(const std::string &srcset) {
	std::string trimmed = Trim(srcset);
	size_t end = 0;
	while (end < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[end])) && trimmed[end] != ',') {
		end++;
	}
	return trimmed.substr(0, end);
}

// Maps DOM values back to byte offsets in the raw source. Values are searched
// forward from the element's line so document order is preserved.
class OffsetLocator {
public:
	explicit OffsetLocator(const std::string &html) : html_(html), lines_(html) {}

	size_t Locate(const std::string &value, long line) {
		size_t start = line > 0 ? lines_.LineStart(static_cast<size_t>(line)) : 0;
		if (start < last_) {
			start = last_;
		}
		size_t found = html_.find(value, start);
		if (found == std::string::npos) {
			// Entity-encoded in the source, e.g. "&amp;"
			std::string encoded;
			for (char c : value) {
				encoded += c == '&' ? std::string("&amp;") : std::string(1, c);
			}
			found = html_.find(encoded, start);
		}
		if (found == std::string::npos) {
			return std::min(start, html_.size());
		}
		last_ = found + 1;
		return found;
	}

private:
	const std::string &html_;
	LineIndex lines_;
	size_t last_ = 0;
};

std::vector<RawLink> LinkExtractor::ExtractHtmlLinks(const std::string &content) {
	std::vector<RawLink> links;
	if (content.empty()) {
		return links;
	}
	XmlDocGuard doc = ParseHtml(content);
	if (!doc) {
		return links;
	}
	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		return links;
	}

	OffsetLocator locator(content);
	auto emit = [&](const std::string &value, long line, LinkKind kind) {
		std::string text = Trim(value);
		if (text.empty()) {
			return;
		}
		RawLink link;
		link.text = text;
		link.offset = locator.Locate(text, line);
		link.kind = kind;
		links.push_back(std::move(link));
	};

	std::function<void(xmlNodePtr, bool)> walk = [&](xmlNodePtr node, bool inside_anchor) {
		for (xmlNodePtr cur = node; cur; cur = cur->next) {
			if (cur->type == XML_ELEMENT_NODE) {
				long line = xmlGetLineNo(cur);
				if (!NameIs(cur, "base")) {
					std::string href = GetAttribute(cur, "href");
					if (!href.empty()) {
						emit(href, line, LinkKind::HTML_HREF);
					}
				}
				std::string src = GetAttribute(cur, "src");
				if (!src.empty()) {
					emit(src, line, LinkKind::HTML_SRC);
				}
				std::string srcset = GetAttribute(cur, "srcset");
				if (!srcset.empty()) {
					emit(FirstSrcsetCandidate(srcset), line, LinkKind::HTML_SRC);
				}
				// Script and style bodies are code, not prose
				if (NameIs(cur, "script") || NameIs(cur, "style")) {
					continue;
				}
				walk(cur->children, inside_anchor || NameIs(cur, "a"));
			} else if (cur->type == XML_TEXT_NODE && !inside_anchor && cur->content) {
				std::string text(reinterpret_cast<const char *>(cur->content));
				std::vector<RawLink> found;
				ScanBareLinks(text, 0, text.size(), found);
				long line = xmlGetLineNo(cur);
				for (const auto &link : found) {
					emit(link.text, line, link.kind);
				}
			}
		}
	};
	walk(root, false);

	FinalizeLinks(content, links);
	return links;
}

std::set<std::string> LinkExtractor::ExtractHtmlAnchors(const std::string &content) {
	std::set<std::string> anchors;
	if (content.empty()) {
		return anchors;
	}
	XmlDocGuard doc = ParseHtml(content);
	if (!doc) {
		return anchors;
	}
	std::function<void(xmlNodePtr)> walk = [&](xmlNodePtr node) {
		for (xmlNodePtr cur = node; cur; cur = cur->next) {
			if (cur->type != XML_ELEMENT_NODE) {
				continue;
			}
			std::string id = GetAttribute(cur, "id");
			if (!id.empty()) {
				anchors.insert(id);
			}
			if (NameIs(cur, "a")) {
				std::string name = GetAttribute(cur, "name");
				if (!name.empty()) {
					anchors.insert(name);
				}
			}
			walk(cur->children);
		}
	};
	walk(xmlDocGetRootElement(doc.get()));
	return anchors;
}

} // namespace linkcheck
