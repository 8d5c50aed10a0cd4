#include <cinegraph/graph/neo4j_codec.hpp>

#include <nlohmann/json.hpp>

namespace cinegraph {

namespace {

Error MakeCodecError(const std::string& endpoint, const std::string& message) {
    return Error{"ParseTransactionResponse", endpoint, std::nullopt, message,
                 std::nullopt, ErrorCategory::Query};
}

bool Contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

// Scalars only; nested containers are not part of any row contract.
Result<PropertyValue, std::string> ToProperty(const nlohmann::json& j) {
    using R = Result<PropertyValue, std::string>;
    if (j.is_null()) return R::Ok(std::monostate{});
    if (j.is_boolean()) return R::Ok(static_cast<int64_t>(j.get<bool>() ? 1 : 0));
    if (j.is_number_integer()) return R::Ok(j.get<int64_t>());
    if (j.is_number_float()) return R::Ok(j.get<double>());
    if (j.is_string()) return R::Ok(j.get<std::string>());
    return R::Err("unsupported property type " + std::string(j.type_name()));
}

Result<Value, std::string> ToValue(const nlohmann::json& j,
                                   const std::string* node_label) {
    using R = Result<Value, std::string>;

    if (node_label != nullptr) {
        if (j.is_null()) return R::Ok(std::monostate{});
        if (!j.is_object()) {
            return R::Err("expected a node map, got " + std::string(j.type_name()));
        }
        Node node;
        node.label = *node_label;
        for (const auto& [key, prop] : j.items()) {
            auto converted = ToProperty(prop);
            if (converted.IsErr()) {
                return R::Err("property '" + key + "': " + converted.Error());
            }
            if (std::holds_alternative<std::monostate>(converted.Value())) {
                continue;  // absent attribute
            }
            node.properties[key] = std::move(converted).Value();
        }
        return R::Ok(std::move(node));
    }

    if (j.is_array()) {
        StringList list;
        list.reserve(j.size());
        for (const auto& item : j) {
            if (item.is_null()) continue;
            if (!item.is_string()) {
                return R::Err("expected a list of strings, found " +
                              std::string(item.type_name()));
            }
            list.push_back(item.get<std::string>());
        }
        return R::Ok(std::move(list));
    }
    if (j.is_object()) {
        return R::Err("unexpected map value");
    }

    auto scalar = ToProperty(j);
    if (scalar.IsErr()) return R::Err(scalar.Error());
    return std::visit([](auto&& v) -> R { return R::Ok(Value{v}); },
                      std::move(scalar).Value());
}

} // anonymous namespace

ErrorCategory CategoryFromNeo4jCode(std::string_view code) {
    if (Contains(code, ".Security.")) {
        return ErrorCategory::StoreUnavailable;
    }
    if (Contains(code, "Timeout") || Contains(code, "TimedOut")) {
        return ErrorCategory::Timeout;
    }
    if (code.rfind("Neo.TransientError.", 0) == 0) {
        return ErrorCategory::StoreUnavailable;
    }
    return ErrorCategory::Query;
}

std::string BuildTransactionRequest(const CypherStatement& statement) {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [key, value] : statement.parameters) {
        params[key] = value;
    }
    nlohmann::json body = {
        {"statements", nlohmann::json::array({
            {{"statement", statement.text}, {"parameters", params}}
        })}
    };
    return body.dump();
}

Result<std::vector<Row>, Error> ParseTransactionResponse(
    std::string_view body,
    const CypherStatement& statement,
    const std::string& endpoint) {
    using R = Result<std::vector<Row>, Error>;

    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return R::Err(MakeCodecError(endpoint, "Malformed response: not a JSON object"));
    }

    auto errors_it = doc.find("errors");
    if (errors_it != doc.end() && errors_it->is_array() && !errors_it->empty()) {
        const auto& first = errors_it->front();
        if (!first.is_object()) {
            return R::Err(MakeCodecError(endpoint,
                "Malformed response: error entry is not an object"));
        }
        auto code_it = first.find("code");
        auto message_it = first.find("message");
        if ((code_it != first.end() && !code_it->is_string()) ||
            (message_it != first.end() && !message_it->is_string())) {
            return R::Err(MakeCodecError(endpoint,
                "Malformed response: error code and message must be strings"));
        }
        std::string code = code_it != first.end() ? code_it->get<std::string>() : "";
        std::string message =
            message_it != first.end() ? message_it->get<std::string>() : "query failed";
        return R::Err(Error{"ExecuteQuery", endpoint, std::nullopt, message,
                            code.empty() ? std::nullopt : std::optional<std::string>(code),
                            CategoryFromNeo4jCode(code)});
    }

    auto results_it = doc.find("results");
    if (results_it == doc.end() || !results_it->is_array() || results_it->empty()) {
        return R::Err(MakeCodecError(endpoint, "Malformed response: no results"));
    }
    const auto& result = results_it->front();
    auto cols_it = result.find("columns");
    auto data_it = result.find("data");
    if (cols_it == result.end() || !cols_it->is_array() ||
        data_it == result.end() || !data_it->is_array()) {
        return R::Err(MakeCodecError(endpoint, "Malformed response: missing columns or data"));
    }

    std::vector<std::string> columns;
    for (const auto& c : *cols_it) {
        if (!c.is_string()) {
            return R::Err(MakeCodecError(endpoint, "Malformed response: non-string column name"));
        }
        columns.push_back(c.get<std::string>());
    }

    std::vector<Row> rows;
    rows.reserve(data_it->size());
    for (const auto& entry : *data_it) {
        auto row_it = entry.find("row");
        if (row_it == entry.end() || !row_it->is_array() ||
            row_it->size() != columns.size()) {
            return R::Err(MakeCodecError(endpoint,
                "Malformed response: row does not match columns"));
        }

        Row row;
        for (size_t i = 0; i < columns.size(); ++i) {
            const auto& name = columns[i];
            auto label_it = statement.node_columns.find(name);
            const std::string* label =
                label_it == statement.node_columns.end() ? nullptr : &label_it->second;
            auto value = ToValue((*row_it)[i], label);
            if (value.IsErr()) {
                return R::Err(MakeCodecError(endpoint,
                    "Column '" + name + "': " + value.Error()));
            }
            row[name] = std::move(value).Value();
        }
        rows.push_back(std::move(row));
    }
    return R::Ok(std::move(rows));
}

} // namespace cinegraph
