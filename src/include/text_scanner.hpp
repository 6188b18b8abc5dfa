#pragma once

#include "link_types.hpp"
#include <string>
#include <vector>

namespace linkcheck {

// Maps byte offsets to 1-based line/column pairs
class LineIndex {
public:
	explicit LineIndex(const std::string &content);

	size_t LineOf(size_t offset) const;
	size_t ColumnOf(size_t offset) const;
	// Offset of the first byte of a 1-based line (content size if past the end)
	size_t LineStart(size_t line) const;

	void Locate(RawLink &link) const {
		link.line = LineOf(link.offset);
		link.column = ColumnOf(link.offset);
	}

private:
	std::vector<size_t> line_starts_;
	size_t size_;
};

// Appends bare URL and mail-address shaped substrings of text[begin, end) to links.
// Offsets are absolute positions in text. Linear in the length of the range.
void ScanBareLinks(const std::string &text, size_t begin, size_t end, std::vector<RawLink> &links);

// Sorts by offset and assigns sequential indices and line/column positions
void FinalizeLinks(const std::string &content, std::vector<RawLink> &links);

} // namespace linkcheck
