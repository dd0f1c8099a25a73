#include "d1/d1_http_driver.hpp"
#include "core/utils.hpp"
#include "db/error_translation.hpp"
#include "sql/sql.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <set>

namespace unisql {

namespace {

DriverCapabilities d1_capabilities() {
    DriverCapabilities caps;
    caps.supports_transactions = false;
    caps.supports_batch = true;
    caps.transaction_fallback = TransactionFallback::REJECT;
    return caps;
}

D1Client& resolve(DriverClient& client) {
    if (auto* d1 = dynamic_cast<D1Client*>(&client)) {
        return *d1;
    }
    throw DriverError("d1 driver received a client it did not create");
}

JsonValue statement_body(const std::string& sql, const Params& params) {
    auto body = JsonValue::object();
    body.set("sql", sql);
    body.set("params", D1HttpDriver::encode_params(params));
    return body;
}

// "a, b" from the envelope's errors array
std::string join_errors(const JsonValue& errors) {
    std::string joined;
    errors.for_each_element([&](const JsonValue& error) {
        if (!joined.empty()) joined += ", ";
        joined += error.value<std::string>("message", "unknown error");
    });
    return joined;
}

// Statuses that mean the request never reached the database
bool is_transport_status(int status) {
    return status == httplib::StatusCode::Unauthorized_401 ||
           status == httplib::StatusCode::Forbidden_403 ||
           status == httplib::StatusCode::NotFound_404 ||
           status == httplib::StatusCode::TooManyRequests_429 ||
           status >= 500;
}

} // namespace

// ============================================================================
// D1Client
// ============================================================================

D1Client::D1Client(D1Options options)
    : options_(std::move(options)) {
    const auto& url = options_.base_url;
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos ||
        (!url.starts_with("http://") && !url.starts_with("https://"))) {
        throw ConnectionError(std::format("invalid D1 base url '{}'", url));
    }
    const auto path_start = url.find('/', scheme_end + 3);
    host_ = url.substr(0, path_start);
    std::string prefix = path_start == std::string::npos ? "" : url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    path_ = std::format("{}/accounts/{}/d1/database/{}/query",
                        prefix, options_.account_id, options_.database_id);
}

JsonValue D1Client::query(const JsonValue& body, const std::string& sql,
                          const Params& params) const {
    httplib::Client cli(host_);
    cli.set_connection_timeout(options_.timeout);
    cli.set_read_timeout(options_.timeout);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + options_.api_token}
    };

    auto res = cli.Post(path_, headers, body.dump(), "application/json");
    if (!res) {
        throw ConnectionError(std::format("D1 request to {} failed: {}",
                                          host_, httplib::to_string(res.error())));
    }

    JsonValue envelope;
    bool parsed = true;
    try {
        envelope = JsonValue::parse(res->body);
    } catch (const JsonValue::parse_error&) {
        parsed = false;
    }

    if (res->status != httplib::StatusCode::OK_200) {
        // SQL errors come back as 4xx with a regular envelope
        if (!parsed || is_transport_status(res->status) || envelope["errors"].empty()) {
            throw ConnectionError(std::format("D1 HTTP API error: {} - {}", res->status,
                                              res->body.substr(0, 200)),
                                  std::to_string(res->status));
        }
        translate_sqlite_message(join_errors(envelope["errors"]), sql, params);
    }
    if (!parsed || !envelope.is_object()) {
        throw ConnectionError("D1 HTTP API returned a malformed response");
    }
    if (!envelope.value<bool>("success", false)) {
        translate_sqlite_message(join_errors(envelope["errors"]), sql, params);
    }
    return envelope["result"];
}

// ============================================================================
// D1HttpDriver
// ============================================================================

D1HttpDriver::D1HttpDriver(D1Options options,
                           InstrumentationOptions instrumentation,
                           std::string name)
    : Driver(std::move(name), Dialect::SQLITE, d1_capabilities(),
             sqlite_result_parser(), std::move(instrumentation)),
      options_(std::move(options)) {}

D1HttpDriver::~D1HttpDriver() {
    shutdown();
}

JsonValue D1HttpDriver::encode_params(const Params& params) {
    auto out = JsonValue::array();
    for (const auto& param : params) {
        if (const auto* b = std::get_if<bool>(&param)) {
            out.push_back(JsonValue(static_cast<int64_t>(*b ? 1 : 0)));
        } else {
            out.push_back(JsonValue::from_value(param));
        }
    }
    return out;
}

QueryResult D1HttpDriver::decode_result(const JsonValue& result, std::string_view sql) {
    QueryResult out;
    const auto rows = result["results"];

    std::set<std::string> names;
    rows.for_each_element([&](const JsonValue& row) {
        row.for_each_member([&](const std::string& key, const JsonValue&) {
            names.insert(key);
        });
    });
    out.columns.assign(names.begin(), names.end());

    rows.for_each_element([&](const JsonValue& row) {
        std::vector<Value> cells;
        cells.reserve(out.columns.size());
        for (const auto& column : out.columns) {
            cells.push_back(row[column].to_value());
        }
        out.rows.push_back(std::move(cells));
    });

    if (classify_statement(sql) == StatementShape::ROWS) {
        out.row_count = out.rows.size();
    } else {
        const auto changes = result["meta"].value<int64_t>("changes", 0);
        out.row_count = changes > 0 ? static_cast<uint64_t>(changes) : 0;
    }
    return out;
}

std::shared_ptr<DriverClient> D1HttpDriver::init_client() {
    if (options_.account_id.empty() || options_.database_id.empty() ||
        options_.api_token.empty()) {
        throw ConnectionError("D1 driver requires account_id, database_id and api_token");
    }
    return std::make_shared<D1Client>(options_);
}

void D1HttpDriver::close_client(DriverClient& client) {
    // Nothing to release: requests own their HTTP connections
    (void)resolve(client);
}

QueryResult D1HttpDriver::execute_on(DriverClient& client, const std::string& sql,
                                     const Params& params) {
    const auto result = resolve(client).query(statement_body(sql, params), sql, params);
    if (result.empty()) {
        return {};
    }
    return decode_result(result[size_t{0}], sql);
}

std::vector<QueryResult> D1HttpDriver::execute_batch_on(DriverClient& client,
                                                        const std::vector<BatchQuery>& queries) {
    auto body = JsonValue::array();
    std::string joined;
    for (const auto& q : queries) {
        body.push_back(statement_body(q.sql, q.params));
        if (!joined.empty()) joined += "; ";
        joined += q.sql;
    }

    const auto result = resolve(client).query(body, joined, {});
    if (result.size() != queries.size()) {
        throw QueryError(std::format("D1 returned {} results for {} statements",
                                     result.size(), queries.size()),
                         joined);
    }
    std::vector<QueryResult> out;
    out.reserve(result.size());
    for (size_t i = 0; i < queries.size(); ++i) {
        out.push_back(decode_result(result[i], queries[i].sql));
    }
    return out;
}

} // namespace unisql
