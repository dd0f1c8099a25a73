#include <catch2/catch_test_macros.hpp>
#include "mocks/mock_driver.hpp"
#include "core/error.hpp"
#include "driver/transaction_bound_driver.hpp"
#include "driver/transaction_plan.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace unisql;
using namespace unisql::testing;

namespace {

std::vector<std::string> without_savepoint_suffix(std::vector<std::string> stmts) {
    // SAVEPOINT sp_1_1712345678901 -> SAVEPOINT sp
    for (auto& s : stmts) {
        const auto pos = s.find("sp_");
        if (pos != std::string::npos) s = s.substr(0, pos + 2);
    }
    return stmts;
}

} // namespace

// ============================================================================
// Top level
// ============================================================================

TEST_CASE("Transaction: commits after the callback returns", "[transaction]") {
    MockDriver driver;
    driver.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
    });

    CHECK(driver.statements() ==
          std::vector<std::string>{"BEGIN", "INSERT INTO t VALUES (1)", "COMMIT"});
    CHECK(driver.transaction_depth() == 0);
}

TEST_CASE("Transaction: rolls back and rethrows the callback's error", "[transaction]") {
    MockDriver driver;

    CHECK_THROWS_WITH(driver.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
        throw std::runtime_error("boom");
    }), "boom");

    CHECK(driver.statements() ==
          std::vector<std::string>{"BEGIN", "INSERT INTO t VALUES (1)", "ROLLBACK"});
    CHECK(driver.transaction_depth() == 0);
}

TEST_CASE("Transaction: failing statement rolls back with a QueryError", "[transaction]") {
    MockDriver driver;
    driver.fail_on = "INSERT";

    CHECK_THROWS_AS(driver.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
        tx.execute_raw("INSERT INTO t VALUES (2)");
    }), QueryError);

    CHECK(driver.statements() ==
          std::vector<std::string>{"BEGIN", "INSERT INTO t VALUES (1)", "ROLLBACK"});
}

TEST_CASE("Transaction: BEGIN failure is a TransactionError and skips the callback", "[transaction]") {
    MockDriver driver;
    driver.fail_on = "BEGIN";
    bool ran = false;

    CHECK_THROWS_AS(driver.with_transaction([&](IDriver&) { ran = true; }), TransactionError);
    CHECK_FALSE(ran);
    CHECK(driver.transaction_depth() == 0);
}

TEST_CASE("Transaction: COMMIT failure rolls back and reports TransactionError", "[transaction]") {
    MockDriver driver;
    driver.fail_on = "COMMIT";

    try {
        driver.with_transaction([](IDriver& tx) { tx.execute_raw("UPDATE t SET a = 1"); });
        FAIL("expected TransactionError");
    } catch (const TransactionError& e) {
        CHECK(std::string(e.what()).find("commit failed") != std::string::npos);
        CHECK(e.cause() != nullptr);
    }
    CHECK(driver.statements().back() == "ROLLBACK");
}

TEST_CASE("Transaction: callback sees a bound driver", "[transaction]") {
    MockDriver driver;
    driver.with_transaction([&](IDriver& tx) {
        CHECK(tx.in_transaction());
        CHECK(&tx != static_cast<IDriver*>(&driver));
        CHECK(tx.driver_name() == "mock");
        CHECK(tx.dialect() == Dialect::SQLITE);
        CHECK(driver.transaction_depth() == 1);

        auto& bound = dynamic_cast<TransactionBoundDriver&>(tx);
        CHECK(bound.depth() == 1);
    });
    CHECK_FALSE(driver.in_transaction());
}

TEST_CASE("Transaction: transaction() returns the callback's value", "[transaction]") {
    MockDriver driver;
    driver.on_execute = [](const std::string&, const Params&) {
        QueryResult r;
        r.columns = {"id"};
        r.rows = {{Value{int64_t{7}}}};
        r.row_count = 1;
        return r;
    };

    const auto id = driver.transaction([](IDriver& tx) {
        return std::get<int64_t>(tx.execute_raw("SELECT 7 AS id").rows[0][0]);
    });
    CHECK(id == 7);
}

// ============================================================================
// Nesting
// ============================================================================

TEST_CASE("Transaction: nested call becomes a savepoint", "[transaction][nested]") {
    MockDriver driver;
    driver.with_transaction([&](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
        tx.with_transaction([&](IDriver& inner) {
            CHECK(driver.transaction_depth() == 2);
            CHECK(dynamic_cast<TransactionBoundDriver&>(inner).depth() == 2);
            inner.execute_raw("INSERT INTO t VALUES (2)");
        });
        CHECK(driver.transaction_depth() == 1);
    });

    CHECK(without_savepoint_suffix(driver.statements()) == std::vector<std::string>{
        "BEGIN", "INSERT INTO t VALUES (1)", "SAVEPOINT sp",
        "INSERT INTO t VALUES (2)", "RELEASE SAVEPOINT sp", "COMMIT"});
}

TEST_CASE("Transaction: savepoint failure rolls back only the savepoint", "[transaction][nested]") {
    MockDriver driver;
    driver.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
        try {
            tx.with_transaction([](IDriver& inner) {
                inner.execute_raw("INSERT INTO t VALUES (2)");
                throw std::runtime_error("inner failed");
            });
        } catch (const std::runtime_error&) {
            // handled; the outer transaction continues
        }
        tx.execute_raw("INSERT INTO t VALUES (3)");
    });

    CHECK(without_savepoint_suffix(driver.statements()) == std::vector<std::string>{
        "BEGIN", "INSERT INTO t VALUES (1)", "SAVEPOINT sp", "INSERT INTO t VALUES (2)",
        "ROLLBACK TO SAVEPOINT sp", "RELEASE SAVEPOINT sp", "INSERT INTO t VALUES (3)",
        "COMMIT"});
}

TEST_CASE("Transaction: savepoint names are unique and well formed", "[transaction][nested]") {
    MockDriver driver;
    driver.with_transaction([](IDriver& tx) {
        tx.with_transaction([](IDriver&) {});
        tx.with_transaction([](IDriver&) {});
    });

    std::vector<std::string> names;
    for (const auto& s : driver.statements()) {
        if (s.starts_with("SAVEPOINT ")) names.push_back(s.substr(10));
    }
    REQUIRE(names.size() == 2);
    CHECK(names[0] != names[1]);
    for (const auto& n : names) {
        CHECK(n.starts_with("sp_"));
        CHECK(n.find('_', 3) != std::string::npos);
    }
}

TEST_CASE("Transaction: options on a nested call are ignored with a warning", "[transaction][nested]") {
    auto logger = std::make_shared<CollectingLogger>();
    InstrumentationOptions instr;
    instr.logger = logger;
    MockDriver driver({}, instr);

    driver.with_transaction([](IDriver& tx) {
        TransactionOptions opts;
        opts.isolation_level = IsolationLevel::SERIALIZABLE;
        tx.with_transaction([](IDriver&) {}, opts);
    });

    REQUIRE(logger->count(LogLevel::WARNING) == 1);
    CHECK(logger->at_level(LogLevel::WARNING)[0].message.find("nested") != std::string::npos);
    for (const auto& s : driver.statements()) {
        CHECK(s.find("ISOLATION") == std::string::npos);
    }
}

// ============================================================================
// Options per dialect
// ============================================================================

TEST_CASE("Transaction: postgres isolation and timeout", "[transaction][options]") {
    MockDriver::Options o;
    o.dialect = Dialect::POSTGRESQL;
    MockDriver driver(o);

    TransactionOptions opts;
    opts.isolation_level = IsolationLevel::REPEATABLE_READ;
    opts.timeout = std::chrono::milliseconds(250);
    driver.with_transaction([](IDriver&) {}, opts);

    CHECK(driver.statements() == std::vector<std::string>{
        "BEGIN ISOLATION LEVEL REPEATABLE READ", "SET LOCAL statement_timeout = 250", "COMMIT"});
}

TEST_CASE("Transaction: mysql restores the session timeout after rollback", "[transaction][options]") {
    MockDriver::Options o;
    o.dialect = Dialect::MYSQL;
    MockDriver driver(o);

    TransactionOptions opts;
    opts.isolation_level = IsolationLevel::READ_COMMITTED;
    opts.timeout = std::chrono::milliseconds(1000);
    CHECK_THROWS(driver.with_transaction([](IDriver&) { throw std::runtime_error("x"); }, opts));

    CHECK(driver.statements() == std::vector<std::string>{
        "SET TRANSACTION ISOLATION LEVEL READ COMMITTED",
        "SET SESSION max_execution_time = 1000",
        "START TRANSACTION",
        "ROLLBACK",
        "SET SESSION max_execution_time = 0"});
}

TEST_CASE("plan_transaction: sqlite upgrades weaker isolation with a warning", "[transaction][options]") {
    TransactionOptions opts;
    opts.isolation_level = IsolationLevel::READ_UNCOMMITTED;
    opts.timeout = std::chrono::milliseconds(100);

    auto plan = plan_transaction(Dialect::SQLITE, opts, std::chrono::milliseconds(5000));
    REQUIRE(plan.warnings.size() == 1);
    CHECK(plan.warnings[0].find("SERIALIZABLE") != std::string::npos);
    CHECK(plan.begin == std::vector<std::string>{"PRAGMA busy_timeout = 100", "BEGIN"});
    CHECK(plan.reset == std::vector<std::string>{"PRAGMA busy_timeout = 5000"});

    opts.isolation_level = IsolationLevel::SERIALIZABLE;
    opts.timeout.reset();
    plan = plan_transaction(Dialect::SQLITE, opts);
    CHECK(plan.warnings.empty());
    CHECK(plan.begin == std::vector<std::string>{"BEGIN"});
}

// ============================================================================
// Drivers without transactions
// ============================================================================

TEST_CASE("Transaction: WARN_AND_RUN runs the callback on the root driver", "[transaction][fallback]") {
    auto logger = std::make_shared<CollectingLogger>();
    InstrumentationOptions instr;
    instr.logger = logger;
    MockDriver::Options o;
    o.supports_transactions = false;
    MockDriver driver(o, instr);

    driver.with_transaction([&](IDriver& tx) {
        CHECK(&tx == static_cast<IDriver*>(&driver));
        CHECK_FALSE(tx.in_transaction());
        tx.execute_raw("INSERT INTO t VALUES (1)");
    });

    CHECK(driver.statements() == std::vector<std::string>{"INSERT INTO t VALUES (1)"});
    CHECK(logger->count(LogLevel::WARNING) == 1);
}

TEST_CASE("Transaction: REJECT throws FeatureNotSupportedError", "[transaction][fallback]") {
    auto logger = std::make_shared<CollectingLogger>();
    InstrumentationOptions instr;
    instr.logger = logger;
    MockDriver::Options o;
    o.supports_transactions = false;
    o.supports_batch = true;
    o.fallback = TransactionFallback::REJECT;
    MockDriver driver(o, instr);

    bool ran = false;
    try {
        driver.with_transaction([&](IDriver&) { ran = true; });
        FAIL("expected FeatureNotSupportedError");
    } catch (const FeatureNotSupportedError& e) {
        CHECK(e.feature() == "transaction");
        CHECK(e.suggestion().find("execute_batch") != std::string::npos);
    }
    CHECK_FALSE(ran);
    CHECK(logger->count(LogLevel::ERROR) == 1);
}

TEST_CASE("require_feature: extensions off by default", "[features]") {
    MockDriver::Options o;
    o.dialect = Dialect::POSTGRESQL;
    MockDriver driver(o);

    try {
        driver.require_feature("vector", "nearest");
        FAIL("expected FeatureNotSupportedError");
    } catch (const FeatureNotSupportedError& e) {
        CHECK(e.suggestion().find("pgvector") != std::string::npos);
    }
    CHECK_THROWS_AS(driver.require_feature("geospatial", "within"), FeatureNotSupportedError);
}

// ============================================================================
// Calls on the driver itself from inside a transaction
// ============================================================================

TEST_CASE("Transaction: root driver calls inside the callback join the transaction",
          "[transaction][nested]") {
    MockDriver driver;
    driver.with_transaction([&](IDriver&) {
        CHECK(driver.transaction_depth() == 1);
        driver.execute_raw("INSERT INTO t VALUES (1)");
        driver.with_transaction([&](IDriver& inner) {
            CHECK(inner.in_transaction());
            CHECK(driver.transaction_depth() == 2);
            inner.execute_raw("INSERT INTO t VALUES (2)");
        });
        driver.execute_batch({{"INSERT INTO t VALUES (3)", {}}, {"INSERT INTO t VALUES (4)", {}}});
    });

    CHECK(without_savepoint_suffix(driver.statements()) == std::vector<std::string>{
        "BEGIN", "INSERT INTO t VALUES (1)", "SAVEPOINT sp", "INSERT INTO t VALUES (2)",
        "RELEASE SAVEPOINT sp", "INSERT INTO t VALUES (3)", "INSERT INTO t VALUES (4)",
        "COMMIT"});
    CHECK(driver.transaction_depth() == 0);
}

TEST_CASE("Transaction: another thread opens its own top-level transaction",
          "[transaction][concurrency]") {
    MockDriver driver;
    driver.with_transaction([&](IDriver&) {
        std::thread other([&] {
            driver.with_transaction([](IDriver& tx) {
                tx.execute_raw("INSERT INTO t VALUES (2)");
            });
        });
        other.join();
    });

    const auto stmts = driver.statements();
    CHECK(std::count(stmts.begin(), stmts.end(), "BEGIN") == 2);
    CHECK(std::count(stmts.begin(), stmts.end(), "COMMIT") == 2);
    for (const auto& s : stmts) {
        CHECK_FALSE(s.starts_with("SAVEPOINT"));
    }
}

TEST_CASE("Transaction: root calls after the transaction ends use the root client",
          "[transaction]") {
    MockDriver driver;
    driver.with_transaction([](IDriver&) {});
    driver.clear_statements();

    driver.with_transaction([](IDriver&) {});
    CHECK(driver.statements() == std::vector<std::string>{"BEGIN", "COMMIT"});
}

// ============================================================================
// Begin failures
// ============================================================================

TEST_CASE("Transaction: failure after BEGIN rolls the transaction back",
          "[transaction][options]") {
    MockDriver::Options o;
    o.dialect = Dialect::POSTGRESQL;
    MockDriver driver(o);
    driver.fail_on = "statement_timeout";

    TransactionOptions opts;
    opts.timeout = std::chrono::milliseconds(100);
    bool ran = false;
    CHECK_THROWS_AS(driver.with_transaction([&](IDriver&) { ran = true; }, opts),
                    TransactionError);

    CHECK_FALSE(ran);
    CHECK(driver.statements() == std::vector<std::string>{
        "BEGIN", "SET LOCAL statement_timeout = 100", "ROLLBACK"});
    CHECK(driver.transaction_depth() == 0);
}

TEST_CASE("Transaction: failure before the transaction opens issues no ROLLBACK",
          "[transaction][options]") {
    MockDriver::Options o;
    o.dialect = Dialect::MYSQL;
    MockDriver driver(o);
    driver.fail_on = "SET TRANSACTION";

    TransactionOptions opts;
    opts.isolation_level = IsolationLevel::SERIALIZABLE;
    CHECK_THROWS_AS(driver.with_transaction([](IDriver&) {}, opts), TransactionError);

    CHECK(driver.statements() ==
          std::vector<std::string>{"SET TRANSACTION ISOLATION LEVEL SERIALIZABLE"});
}

// ============================================================================
// Failing log sink
// ============================================================================

namespace {

class ThrowingLogger : public IQueryLogger {
public:
    void log(const QueryLogEvent&) override {
        ++calls;
        throw std::runtime_error("log sink full");
    }
    std::atomic<int> calls{0};
};

} // namespace

TEST_CASE("Transaction: a throwing logger does not change the outcome",
          "[transaction][instrumentation]") {
    auto logger = std::make_shared<ThrowingLogger>();
    InstrumentationOptions instr;
    instr.logger = logger;
    MockDriver driver({}, instr);

    driver.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
    });

    CHECK(driver.statements() ==
          std::vector<std::string>{"BEGIN", "INSERT INTO t VALUES (1)", "COMMIT"});
    CHECK(logger->calls > 0);
    CHECK(driver.transaction_depth() == 0);
}

TEST_CASE("Transaction: a throwing logger keeps the original error type",
          "[transaction][instrumentation]") {
    auto logger = std::make_shared<ThrowingLogger>();
    InstrumentationOptions instr;
    instr.logger = logger;
    MockDriver driver({}, instr);
    driver.fail_on = "INSERT";

    CHECK_THROWS_AS(driver.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO t VALUES (1)");
    }), QueryError);
    CHECK(driver.statements() ==
          std::vector<std::string>{"BEGIN", "INSERT INTO t VALUES (1)", "ROLLBACK"});
}
