#include <catch2/catch_test_macros.hpp>
#include "mocks/mock_driver.hpp"
#include "core/error.hpp"
#include "sqlite/sqlite_driver.hpp"

#include <atomic>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace unisql;
using namespace unisql::testing;

namespace {

void create_users(IDriver& db) {
    db.execute_raw("CREATE TABLE users (id INTEGER PRIMARY KEY, email TEXT UNIQUE, "
                   "active BOOLEAN, score REAL)");
}

int64_t count_users(IDriver& db) {
    return std::get<int64_t>(db.execute_raw("SELECT COUNT(*) AS n FROM users").rows[0][0]);
}

std::string temp_db_path(const std::string& tag) {
    const auto dir = std::filesystem::temp_directory_path();
    const auto path = dir / std::format("unisql_{}_{}.db", tag,
                                        std::chrono::steady_clock::now().time_since_epoch().count());
    return path.string();
}

} // namespace

// ============================================================================
// Statements
// ============================================================================

TEST_CASE("SqliteDriver: insert and select round trip", "[sqlite]") {
    SqliteDriver db;
    create_users(db);

    auto inserted = db.execute_raw("INSERT INTO users (email, active, score) VALUES (?, ?, ?)",
                                   {Value{std::string("ann@example.com")}, Value{true}, Value{4.5}});
    CHECK(inserted.row_count == 1);
    CHECK(inserted.rows.empty());

    auto rows = db.execute(Sql("SELECT id, email, score FROM users WHERE email = ")
                               .bind("ann@example.com"));
    REQUIRE(rows.rows.size() == 1);
    CHECK(rows.columns == std::vector<std::string>{"id", "email", "score"});
    CHECK(rows.row_count == 1);
    CHECK(std::get<int64_t>(rows.rows[0][0]) == 1);
    CHECK(std::get<std::string>(rows.rows[0][1]) == "ann@example.com");
    CHECK(std::get<double>(rows.rows[0][2]) == 4.5);
}

TEST_CASE("SqliteDriver: row_count is affected rows for writes", "[sqlite]") {
    SqliteDriver db;
    create_users(db);
    db.execute_batch({
        {"INSERT INTO users (email) VALUES (?)", {Value{std::string("a")}}},
        {"INSERT INTO users (email) VALUES (?)", {Value{std::string("b")}}},
        {"INSERT INTO users (email) VALUES (?)", {Value{std::string("c")}}},
    });

    CHECK(db.execute_raw("UPDATE users SET active = 1 WHERE email <> 'c'").row_count == 2);
    CHECK(db.execute_raw("DELETE FROM users").row_count == 3);
}

TEST_CASE("SqliteDriver: NULL parameters and cells", "[sqlite]") {
    SqliteDriver db;
    create_users(db);
    db.execute_raw("INSERT INTO users (email, score) VALUES (?, ?)",
                   {Value{std::string("n")}, Value{std::monostate{}}});

    auto r = db.execute_raw("SELECT score FROM users");
    CHECK(is_null(r.rows[0][0]));
}

TEST_CASE("SqliteDriver: parameter count mismatch is a QueryError", "[sqlite]") {
    SqliteDriver db;
    create_users(db);

    CHECK_THROWS_AS(db.execute_raw("INSERT INTO users (email) VALUES (?)"), QueryError);
    CHECK_THROWS_AS(db.execute_raw("INSERT INTO users (email) VALUES (?)",
                                   {Value{std::string("a")}, Value{std::string("b")}}),
                    QueryError);
    CHECK(count_users(db) == 0);
}

TEST_CASE("SqliteDriver: unique violation carries table and columns", "[sqlite][errors]") {
    SqliteDriver db;
    create_users(db);
    db.execute_raw("INSERT INTO users (email) VALUES ('dup@example.com')");

    try {
        db.execute_raw("INSERT INTO users (email) VALUES ('dup@example.com')");
        FAIL("expected UniqueConstraintError");
    } catch (const UniqueConstraintError& e) {
        CHECK(e.table() == "users");
        CHECK(e.columns() == std::vector<std::string>{"email"});
        CHECK(e.code() == "SQLITE_CONSTRAINT_UNIQUE");
    }
}

TEST_CASE("SqliteDriver: foreign keys enforced by default", "[sqlite][errors]") {
    SqliteDriver db;
    create_users(db);
    db.execute_raw("CREATE TABLE posts (id INTEGER PRIMARY KEY, "
                   "author_id INTEGER NOT NULL REFERENCES users(id))");

    CHECK_THROWS_AS(db.execute_raw("INSERT INTO posts (author_id) VALUES (42)"), ForeignKeyError);
}

TEST_CASE("SqliteDriver: syntax errors are QueryErrors with the statement", "[sqlite][errors]") {
    SqliteDriver db;
    try {
        db.execute_raw("SELEC 1");
        FAIL("expected QueryError");
    } catch (const QueryError& e) {
        CHECK(e.query() == "SELEC 1");
        CHECK(e.code() == "SQLITE_ERROR");
    }
}

TEST_CASE("SqliteDriver: count operation normalizes to _result", "[sqlite][parser]") {
    SqliteDriver db;
    create_users(db);
    db.execute_raw("INSERT INTO users (email) VALUES ('x'), ('y')");

    db.set_context(QueryContext{"User", Operation::COUNT});
    auto r = db.execute(Sql("SELECT COUNT(*) FROM users"));
    CHECK(r.columns == std::vector<std::string>{"_result"});
    CHECK(std::get<int64_t>(r.rows[0][0]) == 2);
}

// ============================================================================
// Transactions
// ============================================================================

TEST_CASE("SqliteDriver: committed and rolled back transactions", "[sqlite][transaction]") {
    SqliteDriver db;
    create_users(db);

    db.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO users (email) VALUES ('kept')");
    });
    CHECK(count_users(db) == 1);

    CHECK_THROWS_AS(db.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO users (email) VALUES ('discarded')");
        tx.execute_raw("INSERT INTO users (email) VALUES ('kept')");
    }), UniqueConstraintError);
    CHECK(count_users(db) == 1);
}

TEST_CASE("SqliteDriver: savepoint rollback keeps the outer work", "[sqlite][transaction]") {
    SqliteDriver db;
    create_users(db);

    db.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO users (email) VALUES ('outer')");
        try {
            tx.with_transaction([](IDriver& inner) {
                inner.execute_raw("INSERT INTO users (email) VALUES ('inner')");
                throw std::runtime_error("undo inner");
            });
        } catch (const std::runtime_error&) {
        }
        CHECK(count_users(tx) == 1);
    });

    auto r = db.execute_raw("SELECT email FROM users");
    REQUIRE(r.rows.size() == 1);
    CHECK(std::get<std::string>(r.rows[0][0]) == "outer");
}

TEST_CASE("SqliteDriver: batch is atomic through a transaction", "[sqlite][batch]") {
    SqliteDriver db;
    create_users(db);

    CHECK_THROWS_AS(db.execute_batch({
        {"INSERT INTO users (email) VALUES (?)", {Value{std::string("a")}}},
        {"INSERT INTO users (email) VALUES (?)", {Value{std::string("a")}}},
    }), UniqueConstraintError);
    CHECK(count_users(db) == 0);
}

TEST_CASE("SqliteDriver: root driver calls inside its own transaction nest", "[sqlite][transaction]") {
    SqliteDriver db;
    create_users(db);

    db.with_transaction([&](IDriver&) {
        db.execute_raw("INSERT INTO users (email) VALUES ('outer')");
        CHECK_THROWS_AS(db.with_transaction([&](IDriver&) {
            db.execute_raw("INSERT INTO users (email) VALUES ('inner')");
            throw std::runtime_error("undo inner");
        }), std::runtime_error);

        auto results = db.execute_batch({
            {"INSERT INTO users (email) VALUES (?)", {Value{std::string("b1")}}},
            {"INSERT INTO users (email) VALUES (?)", {Value{std::string("b2")}}},
        });
        CHECK(results.size() == 2);
        CHECK(count_users(db) == 3);
    });

    CHECK(count_users(db) == 3);
    CHECK(db.transaction_depth() == 0);

    CHECK_THROWS_AS(db.with_transaction([&](IDriver&) {
        db.execute_raw("INSERT INTO users (email) VALUES ('rolled back')");
        throw std::runtime_error("undo all");
    }), std::runtime_error);
    CHECK(count_users(db) == 3);
}

TEST_CASE("SqliteDriver: weaker isolation is upgraded with a warning", "[sqlite][transaction]") {
    auto logger = std::make_shared<CollectingLogger>();
    InstrumentationOptions instr;
    instr.logger = logger;
    SqliteDriver db(SqliteOptions{}, instr);
    create_users(db);

    TransactionOptions opts;
    opts.isolation_level = IsolationLevel::READ_COMMITTED;
    opts.timeout = std::chrono::milliseconds(200);
    db.with_transaction([](IDriver& tx) {
        tx.execute_raw("INSERT INTO users (email) VALUES ('w')");
    }, opts);

    CHECK(count_users(db) == 1);
    REQUIRE(logger->count(LogLevel::WARNING) == 1);
    CHECK(logger->at_level(LogLevel::WARNING)[0].message.find("SERIALIZABLE") != std::string::npos);

    auto timeout = db.execute_raw("PRAGMA busy_timeout");
    CHECK(std::get<int64_t>(timeout.rows[0][0]) == 5000);
}

TEST_CASE("SqliteDriver: concurrent transactions serialize", "[sqlite][concurrency]") {
    SqliteDriver db;
    create_users(db);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            db.with_transaction([t](IDriver& tx) {
                for (int i = 0; i < 10; ++i) {
                    tx.execute_raw("INSERT INTO users (email) VALUES (?)",
                                   {Value{std::format("{}-{}", t, i)}});
                }
            });
        });
    }
    for (auto& th : threads) th.join();

    CHECK(count_users(db) == 40);
    CHECK(db.transaction_depth() == 0);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("SqliteDriver: committed data visible from a second driver", "[sqlite][file]") {
    const auto path = temp_db_path("visibility");
    {
        SqliteOptions options;
        options.filename = path;
        SqliteDriver writer(options);
        SqliteDriver reader(options);

        create_users(writer);
        writer.with_transaction([](IDriver& tx) {
            tx.execute_raw("INSERT INTO users (email) VALUES ('shared')");
        });

        auto r = reader.execute_raw("SELECT email FROM users");
        REQUIRE(r.rows.size() == 1);
        CHECK(std::get<std::string>(r.rows[0][0]) == "shared");
    }
    std::filesystem::remove(path);
}

TEST_CASE("SqliteDriver: disconnect then reuse reopens the database", "[sqlite][file]") {
    const auto path = temp_db_path("reopen");
    {
        SqliteOptions options;
        options.filename = path;
        SqliteDriver db(options);
        create_users(db);
        db.execute_raw("INSERT INTO users (email) VALUES ('persisted')");

        db.disconnect();
        CHECK_FALSE(db.is_connected());
        CHECK(count_users(db) == 1);
    }
    std::filesystem::remove(path);
}

TEST_CASE("SqliteDriver: opening a missing read-only file is a ConnectionError", "[sqlite]") {
    SqliteOptions options;
    options.filename = temp_db_path("missing");
    options.read_only = true;
    SqliteDriver db(options);

    CHECK_THROWS_AS(db.connect(), ConnectionError);
    CHECK_FALSE(db.is_connected());
}

TEST_CASE("SqliteDriver: adopts an already opened connection", "[sqlite]") {
    SqliteConnectionFactory factory(SqliteOptions{});
    auto conn = factory.create(":memory:");
    REQUIRE(conn->execute("CREATE TABLE seeded (v TEXT)").success);
    REQUIRE(conn->execute("INSERT INTO seeded VALUES ('x')").success);

    SqliteDriver db(std::move(conn));
    CHECK(db.is_connected());
    auto r = db.execute_raw("SELECT v FROM seeded");
    CHECK(std::get<std::string>(r.rows[0][0]) == "x");

    db.disconnect();
    CHECK_FALSE(db.is_connected());
}

TEST_CASE("SqliteDriver: capabilities", "[sqlite]") {
    SqliteDriver db;
    CHECK(db.dialect() == Dialect::SQLITE);
    CHECK(db.driver_name() == "sqlite");
    CHECK(db.capabilities().supports_transactions);
    CHECK_FALSE(db.capabilities().supports_batch);
    CHECK_FALSE(db.is_connected());
}

TEST_CASE("SqliteDriver: declared column types travel with the result", "[sqlite][types]") {
    SqliteDriver db;
    create_users(db);
    db.execute_raw("INSERT INTO users (email, active, score) VALUES ('a', 1, 0.5)");

    auto r = db.execute_raw("SELECT id, email, active, score, 1 + 1 AS expr FROM users");
    REQUIRE(r.column_types.size() == 5);
    CHECK(r.column_types[0] == GenericColumnType::INTEGER);
    CHECK(r.column_types[1] == GenericColumnType::TEXT);
    CHECK(r.column_types[2] == GenericColumnType::BOOLEAN);
    CHECK(r.column_types[3] == GenericColumnType::DOUBLE_PRECISION);
    CHECK(r.column_types[4] == GenericColumnType::UNKNOWN);

    // The field hook coerces only columns declared boolean
    const auto& parser = db.result_parser();
    CHECK(std::get<bool>(parser.parse_field(r.rows[0][2], r.column_types[2])));
    CHECK(std::get<int64_t>(parser.parse_field(r.rows[0][0], r.column_types[0])) == 1);
}
