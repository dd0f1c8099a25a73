#pragma once

#include "driver/driver.hpp"
#include "tracing/query_logger.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace unisql::testing {

/**
 * @brief Logger that keeps every record (thread-safe)
 */
class CollectingLogger : public IQueryLogger {
public:
    void log(const QueryLogEvent& event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    [[nodiscard]] std::vector<QueryLogEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    [[nodiscard]] std::vector<QueryLogEvent> at_level(LogLevel level) const {
        std::lock_guard lock(mutex_);
        std::vector<QueryLogEvent> out;
        for (const auto& e : events_) {
            if (e.level == level) out.push_back(e);
        }
        return out;
    }

    [[nodiscard]] size_t count(LogLevel level) const { return at_level(level).size(); }

private:
    mutable std::mutex mutex_;
    std::vector<QueryLogEvent> events_;
};

class MockClient : public DriverClient {
public:
    explicit MockClient(int id) : id(id) {}
    const int id;
    std::atomic<bool> closed{false};
};

class MockTransaction : public TransactionHandle {
public:
    explicit MockTransaction(MockClient& root) : root(root) {}
    MockClient& root;
};

struct MockDriverOptions {
    bool supports_transactions = true;
    bool supports_batch = false;
    TransactionFallback fallback = TransactionFallback::WARN_AND_RUN;
    Dialect dialect = Dialect::SQLITE;
    ResultParserChain parser;
};

/**
 * @brief Scripted in-memory driver
 *
 * Records every statement it receives. on_execute decides the result;
 * statements containing fail_on throw a plain std::runtime_error, which the
 * driver base is expected to wrap.
 */
class MockDriver : public Driver {
public:
    using Options = MockDriverOptions;

    explicit MockDriver(Options options = {}, InstrumentationOptions instrumentation = {})
        : Driver("mock", options.dialect, capabilities_for(options),
                 std::move(options.parser), std::move(instrumentation)) {}

    ~MockDriver() override { shutdown(); }

    [[nodiscard]] std::vector<std::string> statements() const {
        std::lock_guard lock(mutex_);
        return statements_;
    }

    void clear_statements() {
        std::lock_guard lock(mutex_);
        statements_.clear();
    }

    std::function<QueryResult(const std::string&, const Params&)> on_execute;
    std::string fail_on;
    std::string fail_message = "mock failure";

    std::chrono::milliseconds init_delay{0};
    std::atomic<int> init_failures{0};     // next N inits throw
    std::atomic<int> init_calls{0};
    std::atomic<int> close_calls{0};
    std::atomic<int> batch_calls{0};
    bool close_throws = false;

    MockClient* last_client = nullptr;

protected:
    std::shared_ptr<DriverClient> init_client() override {
        const int n = ++init_calls;
        if (init_delay.count() > 0) std::this_thread::sleep_for(init_delay);
        if (init_failures.load() > 0) {
            --init_failures;
            throw std::runtime_error("mock connect refused");
        }
        auto client = std::make_shared<MockClient>(n);
        last_client = client.get();
        return client;
    }

    void close_client(DriverClient& client) override {
        ++close_calls;
        if (auto* c = dynamic_cast<MockClient*>(&client)) c->closed = true;
        if (close_throws) throw std::runtime_error("mock close failed");
    }

    QueryResult execute_on(DriverClient&, const std::string& sql, const Params& params) override {
        {
            std::lock_guard lock(mutex_);
            statements_.push_back(sql);
        }
        if (!fail_on.empty() && sql.find(fail_on) != std::string::npos) {
            throw std::runtime_error(fail_message);
        }
        if (on_execute) return on_execute(sql, params);
        return {};
    }

    std::unique_ptr<TransactionHandle> open_transaction(DriverClient& client) override {
        return std::make_unique<MockTransaction>(dynamic_cast<MockClient&>(client));
    }

    std::vector<QueryResult> execute_batch_on(DriverClient&,
                                              const std::vector<BatchQuery>& queries) override {
        ++batch_calls;
        std::vector<QueryResult> out;
        for (const auto& q : queries) {
            {
                std::lock_guard lock(mutex_);
                statements_.push_back("[batch] " + q.sql);
            }
            QueryResult r;
            r.row_count = 1;
            out.push_back(std::move(r));
        }
        return out;
    }

private:
    static DriverCapabilities capabilities_for(const Options& options) {
        DriverCapabilities caps;
        caps.supports_transactions = options.supports_transactions;
        caps.supports_batch = options.supports_batch;
        caps.transaction_fallback = options.fallback;
        return caps;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> statements_;
};

} // namespace unisql::testing
