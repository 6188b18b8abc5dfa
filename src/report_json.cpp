// JSON rendering of the link check Report for check_links_report()

#include "report_json.hpp"
#include "yyjson.hpp"
#include <cstdlib>

namespace duckdb {

using namespace duckdb_yyjson;

// RAII wrapper for yyjson_mut_doc
class YyjsonMutDocGuard {
public:
	YyjsonMutDocGuard() : doc_(yyjson_mut_doc_new(nullptr)) {}
	~YyjsonMutDocGuard() {
		if (doc_) {
			yyjson_mut_doc_free(doc_);
		}
	}
	YyjsonMutDocGuard(const YyjsonMutDocGuard &) = delete;
	YyjsonMutDocGuard &operator=(const YyjsonMutDocGuard &) = delete;

	yyjson_mut_doc *get() const { return doc_; }
	operator bool() const { return doc_ != nullptr; }
private:
	yyjson_mut_doc *doc_;
};

static void AddOptionalString(yyjson_mut_doc *doc, yyjson_mut_val *obj, const char *key, const std::string &value) {
	if (value.empty()) {
		yyjson_mut_obj_add_null(doc, obj, key);
	} else {
		yyjson_mut_obj_add_strncpy(doc, obj, key, value.c_str(), value.size());
	}
}

static yyjson_mut_val *ResultToJson(yyjson_mut_doc *doc, const linkcheck::CheckResult &result) {
	yyjson_mut_val *obj = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_uint(doc, obj, "line", result.link.line);
	yyjson_mut_obj_add_uint(doc, obj, "column", result.link.column);
	yyjson_mut_obj_add_strncpy(doc, obj, "link", result.link.text.c_str(), result.link.text.size());
	yyjson_mut_obj_add_str(doc, obj, "kind", linkcheck::LinkKindToString(result.link.kind));
	AddOptionalString(doc, obj, "target", result.target);
	if (result.has_target_kind) {
		yyjson_mut_obj_add_str(doc, obj, "target_kind", linkcheck::TargetKindToString(result.target_kind));
	} else {
		yyjson_mut_obj_add_null(doc, obj, "target_kind");
	}
	yyjson_mut_obj_add_str(doc, obj, "status", linkcheck::CheckStatusToString(result.status));
	yyjson_mut_obj_add_strncpy(doc, obj, "reason", result.reason.c_str(), result.reason.size());
	if (result.http_status > 0) {
		yyjson_mut_obj_add_int(doc, obj, "http_status", result.http_status);
	} else {
		yyjson_mut_obj_add_null(doc, obj, "http_status");
	}
	AddOptionalString(doc, obj, "detail", result.detail);
	yyjson_mut_obj_add_int(doc, obj, "elapsed_ms", result.elapsed.count());
	yyjson_mut_obj_add_int(doc, obj, "attempts", result.attempts);
	yyjson_mut_obj_add_int(doc, obj, "retries", result.Retries());
	AddOptionalString(doc, obj, "final_url", result.final_url);
	yyjson_mut_obj_add_int(doc, obj, "redirect_count", result.redirect_count);
	return obj;
}

std::string ReportToJson(const linkcheck::Report &report) {
	YyjsonMutDocGuard guard;
	if (!guard) {
		return "{}";
	}
	yyjson_mut_doc *doc = guard.get();
	yyjson_mut_val *root = yyjson_mut_obj(doc);
	yyjson_mut_doc_set_root(doc, root);

	const auto &counts = report.counts;
	yyjson_mut_val *counts_obj = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_int(doc, counts_obj, "total", counts.total);
	yyjson_mut_obj_add_int(doc, counts_obj, "checked", counts.checked);
	yyjson_mut_obj_add_int(doc, counts_obj, "succeeded", counts.succeeded);
	yyjson_mut_obj_add_int(doc, counts_obj, "failed", counts.failed);
	yyjson_mut_obj_add_int(doc, counts_obj, "excluded", counts.excluded);
	yyjson_mut_obj_add_int(doc, counts_obj, "skipped", counts.skipped);
	yyjson_mut_obj_add_int(doc, counts_obj, "redirected", counts.redirected);
	yyjson_mut_obj_add_int(doc, counts_obj, "timeouts", counts.timeouts);
	yyjson_mut_obj_add_int(doc, counts_obj, "cancelled", counts.cancelled);
	yyjson_mut_obj_add_val(doc, root, "counts", counts_obj);

	yyjson_mut_obj_add_bool(doc, root, "timed_out", report.timed_out);
	yyjson_mut_obj_add_int(doc, root, "exit_code", report.ExitCode());

	yyjson_mut_val *documents = yyjson_mut_arr(doc);
	for (const auto &document : report.documents) {
		yyjson_mut_val *doc_obj = yyjson_mut_obj(doc);
		yyjson_mut_obj_add_strncpy(doc, doc_obj, "document", document.document_id.c_str(),
		                           document.document_id.size());
		yyjson_mut_val *results = yyjson_mut_arr(doc);
		for (const auto &result : document.results) {
			yyjson_mut_arr_append(results, ResultToJson(doc, result));
		}
		yyjson_mut_obj_add_val(doc, doc_obj, "results", results);
		yyjson_mut_arr_append(documents, doc_obj);
	}
	yyjson_mut_obj_add_val(doc, root, "documents", documents);

	size_t len = 0;
	char *json_str = yyjson_mut_write(doc, 0, &len);
	if (!json_str) {
		return "{}";
	}
	std::string result(json_str, len);
	free(json_str);
	return result;
}

} // namespace duckdb
