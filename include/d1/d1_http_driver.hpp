#pragma once

#include "core/json.hpp"
#include "driver/driver.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace unisql {

struct D1Options {
    std::string account_id;
    std::string database_id;
    std::string api_token;
    std::string base_url = "https://api.cloudflare.com/client/v4";
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief Endpoint of one D1 database; each request opens its own HTTP client
 */
class D1Client : public DriverClient {
public:
    /// @throws ConnectionError when base_url is not an http(s) URL
    explicit D1Client(D1Options options);

    /**
     * @brief POST body to the query endpoint and return the envelope's result array
     *
     * @throws ConnectionError on transport failures and non-success statuses
     * without a D1 error payload
     * @throws QueryError (or a subtype) when D1 reports the statement failed
     */
    [[nodiscard]] JsonValue query(const JsonValue& body, const std::string& sql,
                                  const Params& params) const;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    D1Options options_;
    std::string host_;   // scheme://host[:port]
    std::string path_;   // {prefix}/accounts/{account}/d1/database/{database}/query
};

/**
 * @brief Cloudflare D1 adapter over its REST API
 *
 * Stateless: every statement is an independent HTTP request. Interactive
 * transactions are rejected; execute_batch() posts all statements in one
 * request, which D1 runs atomically. Rows arrive as JSON objects, so result
 * columns are ordered by name.
 */
class D1HttpDriver : public Driver {
public:
    explicit D1HttpDriver(D1Options options,
                          InstrumentationOptions instrumentation = {},
                          std::string name = "d1-http");

    ~D1HttpDriver() override;

    [[nodiscard]] const D1Options& options() const noexcept { return options_; }

    /// Driver parameter encoding: booleans become 1 / 0
    [[nodiscard]] static JsonValue encode_params(const Params& params);

    /**
     * @brief One element of the envelope's result array to a QueryResult
     *
     * D1 answers reads and writes with the same shape, and meta.changes is
     * the connection's last write count even for a SELECT. row_count comes
     * from meta.changes only when sql is a write by classify_statement().
     */
    [[nodiscard]] static QueryResult decode_result(const JsonValue& result,
                                                   std::string_view sql);

protected:
    std::shared_ptr<DriverClient> init_client() override;
    void close_client(DriverClient& client) override;
    QueryResult execute_on(DriverClient& client, const std::string& sql,
                           const Params& params) override;
    std::vector<QueryResult> execute_batch_on(DriverClient& client,
                                              const std::vector<BatchQuery>& queries) override;

private:
    D1Options options_;
};

} // namespace unisql
