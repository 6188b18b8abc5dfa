// check_links() and check_links_report() table functions
//
// Usage:
//   SELECT document, line, link, status, reason, http_status
//   FROM check_links('docs/**/*.md', exclude = ['^https://internal\.'], max_concurrency = 8)
//   WHERE status = 'failure';
//
//   SELECT exit_code, report->'counts' FROM check_links_report(['README.md', 'docs']);
//
// Inline content:
//   SELECT * FROM check_links('see [guide](./guide.md)', content = true, format = 'markdown', base = 'docs/index.md')

#include "check_links_function.hpp"
#include "link_check_engine.hpp"
#include "link_config.hpp"
#include "logger.hpp"
#include "report_json.hpp"

#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/secret/secret_manager.hpp"
#include "duckdb/catalog/catalog_transaction.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Bind Data
//===--------------------------------------------------------------------===//

struct CheckLinksBindData : public TableFunctionData {
    linkcheck::LinkCheckConfig config;
    vector<linkcheck::InputSpec> inputs;
};

//===--------------------------------------------------------------------===//
// Global State
//===--------------------------------------------------------------------===//

struct CheckLinksGlobalState : public GlobalTableFunctionState {
    linkcheck::Report report;
    idx_t document_idx = 0;
    idx_t result_idx = 0;
    bool checked = false;

    idx_t MaxThreads() const override { return 1; }
};

//===--------------------------------------------------------------------===//
// HTTP Secret Lookup
//===--------------------------------------------------------------------===//

// GitHub token from an http secret scoped to github.com, when none was given
static void ApplyGithubSecret(ClientContext &context, linkcheck::LinkCheckConfig &config) {
    if (!config.github_token.empty()) {
        return;
    }
    auto &secret_manager = SecretManager::Get(context);
    auto transaction = CatalogTransaction::GetSystemCatalogTransaction(context);

    auto secret_match = secret_manager.LookupSecret(transaction, "https://github.com", "http");
    if (!secret_match.HasMatch()) {
        return;
    }

    auto &secret_entry = *secret_match.secret_entry;
    auto *kv_secret = dynamic_cast<const KeyValueSecret *>(secret_entry.secret.get());
    if (!kv_secret) {
        return;  // Not a KeyValueSecret
    }

    Value bearer_token;
    if (kv_secret->TryGetValue("bearer_token", bearer_token) && !bearer_token.IsNull()) {
        config.github_token = bearer_token.ToString();
    }
}

//===--------------------------------------------------------------------===//
// Bind helpers
//===--------------------------------------------------------------------===//

static vector<string> GetStringList(const Value &value) {
    vector<string> result;
    if (value.IsNull()) {
        return result;
    }
    for (auto &child : ListValue::GetChildren(value)) {
        if (!child.IsNull()) {
            result.push_back(StringValue::Get(child));
        }
    }
    return result;
}

static void ReadSettings(ClientContext &context, linkcheck::LinkCheckConfig &config) {
    Value setting_value;
    if (context.TryGetCurrentSetting("linkcheck_user_agent", setting_value) && !setting_value.IsNull()) {
        config.user_agent = setting_value.ToString();
    }
    if (context.TryGetCurrentSetting("linkcheck_timeout_ms", setting_value) && !setting_value.IsNull()) {
        config.timeout = std::chrono::milliseconds(setting_value.GetValue<int64_t>());
    }
    if (context.TryGetCurrentSetting("linkcheck_max_concurrency", setting_value) && !setting_value.IsNull()) {
        config.max_concurrency = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("linkcheck_retry_count", setting_value) && !setting_value.IsNull()) {
        config.retry.max_attempts = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("linkcheck_log_level", setting_value) && !setting_value.IsNull()) {
        linkcheck::Logger::SetLevel(linkcheck::LogLevelFromString(setting_value.ToString()));
    }
}

static void ApplyNamedParameters(TableFunctionBindInput &input, linkcheck::LinkCheckConfig &config,
                                 bool &as_content, bool &has_format, linkcheck::DocumentFormat &format,
                                 string &base) {
    for (auto &kv : input.named_parameters) {
        auto &name = kv.first;
        auto &value = kv.second;
        if (value.IsNull()) {
            continue;
        }
        if (name == "max_concurrency") {
            config.max_concurrency = value.GetValue<int32_t>();
        } else if (name == "max_concurrency_per_host") {
            config.max_concurrency_per_host = value.GetValue<int32_t>();
        } else if (name == "timeout") {
            config.timeout = std::chrono::milliseconds(static_cast<int64_t>(value.GetValue<int32_t>()) * 1000);
        } else if (name == "global_timeout") {
            config.global_timeout = std::chrono::milliseconds(static_cast<int64_t>(value.GetValue<int32_t>()) * 1000);
        } else if (name == "retry_count") {
            config.retry.max_attempts = value.GetValue<int32_t>();
        } else if (name == "backoff_base") {
            config.retry.initial_backoff_ms = value.GetValue<int32_t>();
        } else if (name == "backoff_multiplier") {
            config.retry.backoff_multiplier = value.GetValue<double>();
        } else if (name == "backoff_max") {
            config.retry.max_backoff_ms = value.GetValue<int32_t>();
        } else if (name == "accepted_status_codes") {
            config.accepted_status_codes = linkcheck::StatusCodeSet::Parse(StringValue::Get(value));
        } else if (name == "retry_status_codes") {
            config.retry_status_codes = linkcheck::StatusCodeSet::Parse(StringValue::Get(value));
        } else if (name == "exclude") {
            config.exclude_patterns = GetStringList(value);
        } else if (name == "include") {
            config.include_patterns = GetStringList(value);
        } else if (name == "skip_private") {
            config.SetSkipPrivate(value.GetValue<bool>());
        } else if (name == "exclude_private") {
            config.exclude_private = value.GetValue<bool>();
        } else if (name == "exclude_loopback") {
            config.exclude_loopback = value.GetValue<bool>();
        } else if (name == "exclude_link_local") {
            config.exclude_link_local = value.GetValue<bool>();
        } else if (name == "exclude_mail") {
            config.exclude_mail = value.GetValue<bool>();
        } else if (name == "schemes") {
            config.allowed_schemes = GetStringList(value);
        } else if (name == "user_agent") {
            config.user_agent = StringValue::Get(value);
        } else if (name == "basic_auth") {
            config.basic_auth = linkcheck::BasicAuth::Parse(StringValue::Get(value));
        } else if (name == "headers") {
            for (auto &entry : MapValue::GetChildren(value)) {
                auto &pair = StructValue::GetChildren(entry);
                if (pair.size() == 2 && !pair[0].IsNull() && !pair[1].IsNull()) {
                    config.custom_headers[pair[0].ToString()] = pair[1].ToString();
                }
            }
        } else if (name == "github_token") {
            config.github_token = StringValue::Get(value);
        } else if (name == "insecure_tls") {
            config.insecure_tls = value.GetValue<bool>();
        } else if (name == "check_anchors") {
            config.check_anchors = value.GetValue<bool>();
        } else if (name == "method") {
            config.method = linkcheck::RequestMethodFromString(StringValue::Get(value));
        } else if (name == "max_redirects") {
            config.max_redirects = value.GetValue<int32_t>();
        } else if (name == "root_dir") {
            config.root_dir = StringValue::Get(value);
        } else if (name == "count_skipped_as_checked") {
            config.count_skipped_as_checked = value.GetValue<bool>();
        } else if (name == "format") {
            format = linkcheck::DocumentFormatFromString(StringValue::Get(value));
            has_format = true;
        } else if (name == "base") {
            base = StringValue::Get(value);
        } else if (name == "content") {
            as_content = value.GetValue<bool>();
        }
    }
}

// Shared by check_links() and check_links_report()
static unique_ptr<CheckLinksBindData> BindCheckLinks(ClientContext &context, TableFunctionBindInput &input,
                                                     const char *function_name) {
    auto bind_data = make_uniq<CheckLinksBindData>();

    vector<string> raw_inputs;
    auto &first_arg = input.inputs[0];
    if (first_arg.IsNull()) {
        throw BinderException("%s() requires a path, URL, glob or list of them", function_name);
    }
    if (first_arg.type().id() == LogicalTypeId::LIST) {
        raw_inputs = GetStringList(first_arg);
    } else {
        raw_inputs.push_back(StringValue::Get(first_arg));
    }

    bool as_content = false;
    bool has_format = false;
    linkcheck::DocumentFormat format = linkcheck::DocumentFormat::MARKDOWN;
    string base;
    try {
        ReadSettings(context, bind_data->config);
        ApplyNamedParameters(input, bind_data->config, as_content, has_format, format, base);
        ApplyGithubSecret(context, bind_data->config);
        bind_data->config.Validate();
    } catch (linkcheck::ConfigError &e) {
        throw InvalidInputException("%s(): %s", function_name, e.what());
    }

    for (idx_t i = 0; i < raw_inputs.size(); i++) {
        if (as_content) {
            auto spec = linkcheck::InputSpec::Inline(raw_inputs[i], has_format ? format : linkcheck::DocumentFormat::MARKDOWN,
                                                     base);
            spec.id = raw_inputs.size() == 1 ? "<inline>" : "<inline:" + std::to_string(i) + ">";
            bind_data->inputs.push_back(std::move(spec));
        } else {
            auto spec = linkcheck::InputSpec::Classify(raw_inputs[i]);
            spec.has_format = has_format;
            spec.format = format;
            bind_data->inputs.push_back(std::move(spec));
        }
    }
    return bind_data;
}

static linkcheck::Report RunCheck(const CheckLinksBindData &bind_data) {
    try {
        linkcheck::LinkCheckEngine engine(bind_data.config);
        return engine.Run(bind_data.inputs);
    } catch (linkcheck::ConfigError &e) {
        throw InvalidInputException(e.what());
    } catch (linkcheck::InputError &e) {
        throw IOException(e.what());
    }
}

//===--------------------------------------------------------------------===//
// check_links()
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> CheckLinksBind(ClientContext &context, TableFunctionBindInput &input,
                                               vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = BindCheckLinks(context, input, "check_links");

    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("document");
    return_types.push_back(LogicalType::BIGINT);
    names.push_back("line");
    return_types.push_back(LogicalType::BIGINT);
    names.push_back("column");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("link");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("kind");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("target");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("target_kind");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("status");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("reason");
    return_types.push_back(LogicalType::INTEGER);
    names.push_back("http_status");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("detail");
    return_types.push_back(LogicalType::BIGINT);
    names.push_back("elapsed_ms");
    return_types.push_back(LogicalType::INTEGER);
    names.push_back("attempts");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("final_url");

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> CheckLinksInitGlobal(ClientContext &context,
                                                                 TableFunctionInitInput &input) {
    return make_uniq<CheckLinksGlobalState>();
}

static Value OptionalString(const string &value) {
    return value.empty() ? Value() : Value(value);
}

static void CheckLinksFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
    auto &bind_data = data.bind_data->Cast<CheckLinksBindData>();
    auto &state = data.global_state->Cast<CheckLinksGlobalState>();

    // Run the whole check on the first call
    if (!state.checked) {
        state.report = RunCheck(bind_data);
        state.checked = true;
    }

    idx_t count = 0;
    auto &documents = state.report.documents;
    while (count < STANDARD_VECTOR_SIZE && state.document_idx < documents.size()) {
        auto &document = documents[state.document_idx];
        if (state.result_idx >= document.results.size()) {
            state.document_idx++;
            state.result_idx = 0;
            continue;
        }
        const auto &result = document.results[state.result_idx++];

        output.SetValue(0, count, Value(document.document_id));
        output.SetValue(1, count, Value::BIGINT(static_cast<int64_t>(result.link.line)));
        output.SetValue(2, count, Value::BIGINT(static_cast<int64_t>(result.link.column)));
        output.SetValue(3, count, Value(result.link.text));
        output.SetValue(4, count, Value(linkcheck::LinkKindToString(result.link.kind)));
        output.SetValue(5, count, OptionalString(result.target));
        output.SetValue(6, count, result.has_target_kind ? Value(linkcheck::TargetKindToString(result.target_kind))
                                                         : Value());
        output.SetValue(7, count, Value(linkcheck::CheckStatusToString(result.status)));
        output.SetValue(8, count, Value(result.reason));
        output.SetValue(9, count, result.http_status > 0 ? Value::INTEGER(result.http_status) : Value());
        output.SetValue(10, count, OptionalString(result.detail));
        output.SetValue(11, count, Value::BIGINT(result.elapsed.count()));
        output.SetValue(12, count, Value::INTEGER(result.attempts));
        output.SetValue(13, count, OptionalString(result.final_url));

        count++;
    }

    output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// check_links_report()
//===--------------------------------------------------------------------===//

struct CheckLinksReportGlobalState : public GlobalTableFunctionState {
    bool done = false;

    idx_t MaxThreads() const override { return 1; }
};

static unique_ptr<FunctionData> CheckLinksReportBind(ClientContext &context, TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = BindCheckLinks(context, input, "check_links_report");

    return_types.push_back(LogicalType::JSON());
    names.push_back("report");
    return_types.push_back(LogicalType::INTEGER);
    names.push_back("exit_code");

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> CheckLinksReportInitGlobal(ClientContext &context,
                                                                       TableFunctionInitInput &input) {
    return make_uniq<CheckLinksReportGlobalState>();
}

static void CheckLinksReportFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
    auto &bind_data = data.bind_data->Cast<CheckLinksBindData>();
    auto &state = data.global_state->Cast<CheckLinksReportGlobalState>();

    if (state.done) {
        output.SetCardinality(0);
        return;
    }
    state.done = true;

    auto report = RunCheck(bind_data);
    output.SetValue(0, 0, Value(ReportToJson(report)));
    output.SetValue(1, 0, Value::INTEGER(report.ExitCode()));
    output.SetCardinality(1);
}

//===--------------------------------------------------------------------===//
// Register Function
//===--------------------------------------------------------------------===//

void RegisterCheckLinksFunction(ExtensionLoader &loader) {
    // Named parameters helper
    auto add_params = [](TableFunction &func) {
        func.named_parameters["max_concurrency"] = LogicalType::INTEGER;
        func.named_parameters["max_concurrency_per_host"] = LogicalType::INTEGER;
        func.named_parameters["timeout"] = LogicalType::INTEGER;
        func.named_parameters["global_timeout"] = LogicalType::INTEGER;
        func.named_parameters["retry_count"] = LogicalType::INTEGER;
        func.named_parameters["backoff_base"] = LogicalType::INTEGER;
        func.named_parameters["backoff_multiplier"] = LogicalType::DOUBLE;
        func.named_parameters["backoff_max"] = LogicalType::INTEGER;
        func.named_parameters["accepted_status_codes"] = LogicalType::VARCHAR;
        func.named_parameters["retry_status_codes"] = LogicalType::VARCHAR;
        func.named_parameters["exclude"] = LogicalType::LIST(LogicalType::VARCHAR);
        func.named_parameters["include"] = LogicalType::LIST(LogicalType::VARCHAR);
        func.named_parameters["skip_private"] = LogicalType::BOOLEAN;
        func.named_parameters["exclude_private"] = LogicalType::BOOLEAN;
        func.named_parameters["exclude_loopback"] = LogicalType::BOOLEAN;
        func.named_parameters["exclude_link_local"] = LogicalType::BOOLEAN;
        func.named_parameters["exclude_mail"] = LogicalType::BOOLEAN;
        func.named_parameters["schemes"] = LogicalType::LIST(LogicalType::VARCHAR);
        func.named_parameters["user_agent"] = LogicalType::VARCHAR;
        func.named_parameters["basic_auth"] = LogicalType::VARCHAR;
        func.named_parameters["headers"] = LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR);
        func.named_parameters["github_token"] = LogicalType::VARCHAR;
        func.named_parameters["insecure_tls"] = LogicalType::BOOLEAN;
        func.named_parameters["check_anchors"] = LogicalType::BOOLEAN;
        func.named_parameters["method"] = LogicalType::VARCHAR;
        func.named_parameters["max_redirects"] = LogicalType::INTEGER;
        func.named_parameters["root_dir"] = LogicalType::VARCHAR;
        func.named_parameters["count_skipped_as_checked"] = LogicalType::BOOLEAN;
        func.named_parameters["format"] = LogicalType::VARCHAR;
        func.named_parameters["base"] = LogicalType::VARCHAR;
        func.named_parameters["content"] = LogicalType::BOOLEAN;
    };

    TableFunction list_func("check_links", {LogicalType::LIST(LogicalType::VARCHAR)}, CheckLinksFunction,
                            CheckLinksBind, CheckLinksInitGlobal);
    add_params(list_func);
    TableFunction single_func("check_links", {LogicalType::VARCHAR}, CheckLinksFunction, CheckLinksBind,
                              CheckLinksInitGlobal);
    add_params(single_func);

    TableFunctionSet check_set("check_links");
    check_set.AddFunction(list_func);
    check_set.AddFunction(single_func);
    loader.RegisterFunction(check_set);

    TableFunction report_list_func("check_links_report", {LogicalType::LIST(LogicalType::VARCHAR)},
                                   CheckLinksReportFunction, CheckLinksReportBind, CheckLinksReportInitGlobal);
    add_params(report_list_func);
    TableFunction report_single_func("check_links_report", {LogicalType::VARCHAR}, CheckLinksReportFunction,
                                     CheckLinksReportBind, CheckLinksReportInitGlobal);
    add_params(report_single_func);

    TableFunctionSet report_set("check_links_report");
    report_set.AddFunction(report_list_func);
    report_set.AddFunction(report_single_func);
    loader.RegisterFunction(report_set);
}

} // namespace duckdb
