#include "input_loader.hpp"
#include "link_extractor.hpp"
#include "link_utils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <glob.h>
#include <sstream>

namespace linkcheck {

namespace fs = std::filesystem;

//===--------------------------------------------------------------------===//
// InputSpec
//===--------------------------------------------------------------------===//

InputSpec InputSpec::Classify(const std::string &input) {
	InputSpec spec;
	spec.value = Trim(input);
	if (StartsWithNoCase(spec.value, "http://") || StartsWithNoCase(spec.value, "https://")) {
		spec.kind = InputKind::URL;
	} else if (spec.value.find_first_of("*?[") != std::string::npos) {
		spec.kind = InputKind::GLOB;
	} else {
		spec.kind = InputKind::FILE_PATH;
	}
	return spec;
}

InputSpec InputSpec::Inline(const std::string &content, DocumentFormat format, const std::string &base) {
	InputSpec spec;
	spec.kind = InputKind::INLINE;
	spec.value = content;
	spec.has_format = true;
	spec.format = format;
	spec.base = base;
	return spec;
}

//===--------------------------------------------------------------------===//
// InputLoader
//===--------------------------------------------------------------------===//

InputLoader::InputLoader(const LinkCheckConfig &config, HttpTransport &transport)
    : config_(config), transport_(transport) {
}

static bool IsDocumentFile(const fs::path &path) {
	std::string name = path.filename().string();
	if (EndsWith(ToLower(name), ".gz")) {
		name = name.substr(0, name.size() - 3);
	}
	return LinkExtractor::InferFormat(name) != DocumentFormat::PLAINTEXT;
}

std::vector<std::string> InputLoader::WalkDirectory(const std::string &dir) {
	std::vector<std::string> files;
	std::error_code ec;
	fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
	if (ec) {
		throw InputError("Cannot read directory " + dir + ": " + ec.message());
	}
	for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
		if (ec) {
			Logger::Warn("Stopped walking " + dir + ": " + ec.message());
			break;
		}
		// Hidden directories (.git, .cache) hold no documentation
		std::string name = it->path().filename().string();
		if (it->is_directory(ec) && StartsWith(name, ".")) {
			it.disable_recursion_pending();
			continue;
		}
		if (it->is_regular_file(ec) && IsDocumentFile(it->path())) {
			files.push_back(it->path().string());
		}
	}
	std::sort(files.begin(), files.end());
	return files;
}

std::vector<std::string> InputLoader::ExpandGlob(const std::string &pattern) {
	std::vector<std::string> matches;
	glob_t results;
	int rc = glob(pattern.c_str(), 0, nullptr, &results);
	if (rc == 0) {
		for (size_t i = 0; i < results.gl_pathc; i++) {
			matches.emplace_back(results.gl_pathv[i]);
		}
	}
	globfree(&results);
	if (rc != 0 && rc != GLOB_NOMATCH) {
		throw InputError("Cannot expand glob pattern '" + pattern + "'");
	}
	std::sort(matches.begin(), matches.end());
	return matches;
}

void InputLoader::Truncate(Document &doc) const {
	if (config_.max_document_bytes > 0 && doc.content.size() > config_.max_document_bytes) {
		Logger::Warn("Document " + doc.id + " exceeds " + std::to_string(config_.max_document_bytes) +
		             " bytes, checking only the beginning");
		doc.content.resize(config_.max_document_bytes);
	}
}

Document InputLoader::LoadFile(const std::string &path, const InputSpec &spec) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		throw InputError("Cannot read input file: " + path);
	}
	std::ostringstream buffer;
	buffer << file.rdbuf();

	Document doc;
	doc.id = path;
	doc.base = path;
	doc.content = buffer.str();

	std::string format_path = path;
	if (EndsWith(ToLower(path), ".gz") || IsGzippedData(doc.content)) {
		bool capped = false;
		std::string inflated = DecompressGzip(doc.content, config_.max_document_bytes, &capped);
		if (inflated.empty() && !doc.content.empty()) {
			throw InputError("Cannot decompress gzip input: " + path);
		}
		if (capped) {
			Logger::Warn("Document " + path + " inflates past " + std::to_string(config_.max_document_bytes) +
			             " bytes, checking only the beginning");
		}
		doc.content = std::move(inflated);
		if (EndsWith(ToLower(path), ".gz")) {
			format_path = path.substr(0, path.size() - 3);
		}
	}
	doc.format = spec.has_format ? spec.format : LinkExtractor::InferFormat(format_path);
	Truncate(doc);
	return doc;
}

Document InputLoader::LoadUrl(const std::string &url, const InputSpec &spec) {
	HttpRequest request;
	request.url = url;
	request.method = RequestMethod::GET;
	request.user_agent = config_.user_agent;
	request.timeout = config_.timeout;
	request.connect_timeout = config_.connect_timeout;
	request.basic_auth = config_.basic_auth;
	request.max_redirects = config_.max_redirects;
	request.insecure_tls = config_.insecure_tls;
	request.keep_body = true;
	request.max_body_bytes = config_.max_document_bytes;
	request.headers.assign(config_.custom_headers.begin(), config_.custom_headers.end());

	HttpResponse response = transport_.Execute(request);
	if (!response.Completed()) {
		throw InputError("Cannot fetch input " + url + ": " + response.error);
	}
	if (response.status_code < 200 || response.status_code >= 300) {
		throw InputError("Cannot fetch input " + url + ": HTTP " + std::to_string(response.status_code));
	}

	Document doc;
	doc.id = url;
	doc.base = response.final_url.empty() ? url : response.final_url;
	doc.content = std::move(response.body);
	if (IsGzippedData(doc.content)) {
		// A cut-off gzip stream cannot be inflated
		if (response.truncated) {
			throw InputError("Compressed input " + url + " exceeds " + std::to_string(config_.max_document_bytes) +
			                 " bytes");
		}
		std::string inflated = DecompressGzip(doc.content, config_.max_document_bytes);
		if (inflated.empty()) {
			throw InputError("Cannot decompress gzip input: " + url);
		}
		doc.content = std::move(inflated);
	}
	if (spec.has_format) {
		doc.format = spec.format;
	} else {
		// Content-Type wins over the extension for fetched documents
		DocumentFormat by_type = LinkExtractor::InferFormat("", response.content_type);
		doc.format = by_type != DocumentFormat::PLAINTEXT ? by_type : LinkExtractor::InferFormat(doc.base);
	}
	if (response.truncated) {
		Logger::Warn("Document " + url + " exceeds " + std::to_string(config_.max_document_bytes) +
		             " bytes, checking only the beginning");
	}
	Truncate(doc);
	return doc;
}

std::vector<Document> InputLoader::Load(const std::vector<InputSpec> &inputs) {
	std::vector<Document> documents;
	for (const auto &spec : inputs) {
		switch (spec.kind) {
		case InputKind::INLINE: {
			Document doc;
			doc.id = spec.id.empty() ? "<inline>" : spec.id;
			doc.content = spec.value;
			doc.base = spec.base;
			doc.format = spec.has_format ? spec.format : DocumentFormat::PLAINTEXT;
			Truncate(doc);
			documents.push_back(std::move(doc));
			break;
		}
		case InputKind::URL:
			documents.push_back(LoadUrl(spec.value, spec));
			break;
		case InputKind::GLOB: {
			auto matches = ExpandGlob(spec.value);
			if (matches.empty()) {
				Logger::Warn("Glob pattern '" + spec.value + "' matched no files");
			}
			for (const auto &match : matches) {
				std::error_code ec;
				if (fs::is_directory(match, ec)) {
					for (const auto &file : WalkDirectory(match)) {
						documents.push_back(LoadFile(file, spec));
					}
				} else {
					// A pattern may sweep up files we cannot read; only explicit paths are fatal
					try {
						documents.push_back(LoadFile(match, spec));
					} catch (InputError &e) {
						Logger::Warn(std::string(e.what()) + ", skipping");
					}
				}
			}
			break;
		}
		case InputKind::FILE_PATH: {
			std::error_code ec;
			if (fs::is_directory(spec.value, ec)) {
				for (const auto &file : WalkDirectory(spec.value)) {
					documents.push_back(LoadFile(file, spec));
				}
			} else {
				documents.push_back(LoadFile(spec.value, spec));
			}
			break;
		}
		}
	}
	return documents;
}

} // namespace linkcheck
