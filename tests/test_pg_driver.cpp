#include <catch2/catch_test_macros.hpp>
#include "mocks/mock_driver.hpp"
#include "core/error.hpp"
#include "postgresql/pg_driver.hpp"
#include "sql/sql.hpp"

#include <cstdlib>
#include <format>
#include <thread>

using namespace unisql;
using namespace unisql::testing;

namespace {

// Live tests need UNISQL_TEST_PG_URL, e.g. postgresql://postgres@localhost/unisql_test
std::string pg_url() {
    const char* url = std::getenv("UNISQL_TEST_PG_URL");
    return url ? url : "";
}

PgDriverOptions pg_options(std::string conninfo) {
    PgDriverOptions options;
    options.pool.connection_string = std::move(conninfo);
    options.pool.min_connections = 1;
    options.pool.max_connections = 4;
    options.pool.acquire_timeout = std::chrono::milliseconds(2000);
    return options;
}

std::string table_name(const char* tag) {
    return std::format("unisql_{}_{}", tag,
                       std::chrono::steady_clock::now().time_since_epoch().count() % 1000000000);
}

// Creates a users table and drops it on scope exit
struct UsersTable {
    PgDriver& db;
    std::string name;

    UsersTable(PgDriver& db, const char* tag) : db(db), name(table_name(tag)) {
        db.execute_raw(std::format("CREATE TABLE {} (id SERIAL PRIMARY KEY, email TEXT UNIQUE, "
                                   "active BOOLEAN, score DOUBLE PRECISION)", name));
    }
    ~UsersTable() {
        try {
            db.execute_raw(std::format("DROP TABLE IF EXISTS {}", name));
        } catch (const DriverError& e) {
            WARN("cleanup failed: " << e.what());
        }
    }
};

} // namespace

TEST_CASE("PgDriver: capabilities follow the extension options", "[pg]") {
    auto options = pg_options("host=127.0.0.1");
    options.pgvector = true;
    PgDriver db(options);
    CHECK(db.dialect() == Dialect::POSTGRESQL);
    CHECK(db.capabilities().supports_transactions);
    CHECK_FALSE(db.capabilities().supports_batch);
    CHECK(db.capabilities().supports_vector);
    CHECK_FALSE(db.capabilities().supports_geospatial);
    CHECK_NOTHROW(db.require_feature("vector", "nearest"));
    CHECK_THROWS_AS(db.require_feature("geospatial", "within"), FeatureNotSupportedError);
}

TEST_CASE("PgDriver: unreachable server is a ConnectionError", "[pg][errors]") {
    auto collector = std::make_shared<CollectingLogger>();
    PgDriver db(pg_options("host=127.0.0.1 port=1 connect_timeout=2"),
                InstrumentationOptions{.logger = collector});

    CHECK_THROWS_AS(db.execute_raw("SELECT 1"), ConnectionError);
    CHECK_FALSE(db.is_connected());
    CHECK(collector->at_level(LogLevel::ERROR).size() == 1);
}

TEST_CASE("PgDriver: statements against a live server", "[pg][live]") {
    if (pg_url().empty()) SKIP("UNISQL_TEST_PG_URL not set");

    PgDriver db(pg_options(pg_url()));
    UsersTable users(db, "users");

    auto insert = Sql(std::format("INSERT INTO {} (email, active, score) VALUES (", users.name))
                      .bind("ann@example.com").append(", ").bind(true)
                      .append(", ").bind(2.5).append(")");
    CHECK(db.execute(insert).row_count == 1);

    auto r = db.execute_raw(std::format("SELECT email, active, score FROM {} WHERE email = $1",
                                        users.name),
                            {Value{std::string("ann@example.com")}});
    REQUIRE(r.rows.size() == 1);
    CHECK(r.columns == std::vector<std::string>{"email", "active", "score"});
    CHECK(std::get<std::string>(r.rows[0][0]) == "ann@example.com");
    CHECK(std::get<bool>(r.rows[0][1]));
    CHECK(std::get<double>(r.rows[0][2]) == 2.5);

    // int8 travels as text to keep it exact
    auto big = db.execute_raw("SELECT 9007199254740993::int8 AS n");
    CHECK(std::get<std::string>(big.rows[0][0]) == "9007199254740993");
}

TEST_CASE("PgDriver: constraint violations are typed", "[pg][live][errors]") {
    if (pg_url().empty()) SKIP("UNISQL_TEST_PG_URL not set");

    PgDriver db(pg_options(pg_url()));
    UsersTable users(db, "uniq");
    const auto sql = std::format("INSERT INTO {} (email) VALUES ($1)", users.name);
    db.execute_raw(sql, {Value{std::string("a@b")}});

    try {
        db.execute_raw(sql, {Value{std::string("a@b")}});
        FAIL("expected UniqueConstraintError");
    } catch (const UniqueConstraintError& e) {
        CHECK(e.code() == "23505");
        CHECK(e.table() == users.name);
        CHECK(e.columns() == std::vector<std::string>{"email"});
    }

    CHECK_THROWS_AS(db.execute_raw("SELECT * FROM unisql_missing_table"), QueryError);
}

TEST_CASE("PgDriver: transactions commit, roll back and nest", "[pg][live][transaction]") {
    if (pg_url().empty()) SKIP("UNISQL_TEST_PG_URL not set");

    PgDriver db(pg_options(pg_url()));
    UsersTable users(db, "tx");
    const auto insert = std::format("INSERT INTO {} (email) VALUES ($1)", users.name);
    const auto count = std::format("SELECT COUNT(*) FROM {}", users.name);

    db.with_transaction([&](IDriver& tx) {
        CHECK(tx.in_transaction());
        tx.execute_raw(insert, {Value{std::string("kept")}});
        CHECK_THROWS_AS(tx.with_transaction([&](IDriver& inner) {
            inner.execute_raw(insert, {Value{std::string("dropped")}});
            throw std::runtime_error("undo inner");
        }), std::runtime_error);
    }, TransactionOptions{.isolation_level = IsolationLevel::SERIALIZABLE,
                          .timeout = std::chrono::milliseconds(5000)});

    CHECK_THROWS_AS(db.with_transaction([&](IDriver& tx) {
        tx.execute_raw(insert, {Value{std::string("rolled back")}});
        throw std::runtime_error("abort");
    }), std::runtime_error);

    auto r = db.execute_raw(count);
    CHECK(std::get<std::string>(r.rows[0][0]) == "1");
    CHECK(db.transaction_depth() == 0);
}

TEST_CASE("PgDriver: concurrent transactions use separate sessions", "[pg][live][transaction]") {
    if (pg_url().empty()) SKIP("UNISQL_TEST_PG_URL not set");

    PgDriver db(pg_options(pg_url()));
    std::vector<std::string> pids(2);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < pids.size(); ++i) {
        threads.emplace_back([&, i] {
            db.with_transaction([&](IDriver& tx) {
                auto r = tx.execute_raw("SELECT pg_backend_pid()::text, pg_sleep(0.2)");
                pids[i] = std::get<std::string>(r.rows[0][0]);
            });
        });
    }
    for (auto& t : threads) t.join();
    CHECK(pids[0] != pids[1]);
}
