// extract_links() table function: links found in a document, without checking them
//
// Usage:
//   SELECT line, "column", link, kind FROM extract_links('See <https://duckdb.org>', format = 'markdown');

#include "extract_links_function.hpp"
#include "link_config.hpp"
#include "link_extractor.hpp"

#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

struct ExtractLinksBindData : public TableFunctionData {
    linkcheck::Document document;
};

struct ExtractLinksGlobalState : public GlobalTableFunctionState {
    vector<linkcheck::RawLink> links;
    idx_t current_idx = 0;
    bool extracted = false;

    idx_t MaxThreads() const override { return 1; }
};

static unique_ptr<FunctionData> ExtractLinksBind(ClientContext &context, TableFunctionBindInput &input,
                                                 vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = make_uniq<ExtractLinksBindData>();
    auto &document = bind_data->document;
    document.id = "<inline>";
    document.format = linkcheck::DocumentFormat::MARKDOWN;

    if (!input.inputs.empty() && !input.inputs[0].IsNull()) {
        document.content = StringValue::Get(input.inputs[0]);
    }

    for (auto &kv : input.named_parameters) {
        if (kv.second.IsNull()) {
            continue;
        }
        if (kv.first == "format") {
            try {
                document.format = linkcheck::DocumentFormatFromString(StringValue::Get(kv.second));
            } catch (linkcheck::ConfigError &e) {
                throw InvalidInputException("extract_links(): %s", e.what());
            }
        } else if (kv.first == "base") {
            document.base = StringValue::Get(kv.second);
        }
    }

    return_types.push_back(LogicalType::BIGINT);
    names.push_back("line");
    return_types.push_back(LogicalType::BIGINT);
    names.push_back("column");
    return_types.push_back(LogicalType::BIGINT);
    names.push_back("offset");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("link");
    return_types.push_back(LogicalType::VARCHAR);
    names.push_back("kind");

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> ExtractLinksInitGlobal(ClientContext &context,
                                                                   TableFunctionInitInput &input) {
    return make_uniq<ExtractLinksGlobalState>();
}

static void ExtractLinksFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
    auto &bind_data = data.bind_data->Cast<ExtractLinksBindData>();
    auto &state = data.global_state->Cast<ExtractLinksGlobalState>();

    if (!state.extracted) {
        state.links = linkcheck::LinkExtractor::ExtractLinks(bind_data.document);
        state.extracted = true;
    }

    idx_t count = 0;
    while (count < STANDARD_VECTOR_SIZE && state.current_idx < state.links.size()) {
        const auto &link = state.links[state.current_idx++];

        output.SetValue(0, count, Value::BIGINT(static_cast<int64_t>(link.line)));
        output.SetValue(1, count, Value::BIGINT(static_cast<int64_t>(link.column)));
        output.SetValue(2, count, Value::BIGINT(static_cast<int64_t>(link.offset)));
        output.SetValue(3, count, Value(link.text));
        output.SetValue(4, count, Value(linkcheck::LinkKindToString(link.kind)));

        count++;
    }

    output.SetCardinality(count);
}

void RegisterExtractLinksFunction(ExtensionLoader &loader) {
    TableFunction func("extract_links", {LogicalType::VARCHAR}, ExtractLinksFunction, ExtractLinksBind,
                       ExtractLinksInitGlobal);
    func.named_parameters["format"] = LogicalType::VARCHAR;
    func.named_parameters["base"] = LogicalType::VARCHAR;

    loader.RegisterFunction(func);
}

} // namespace duckdb
