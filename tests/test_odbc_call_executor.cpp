#include <gtest/gtest.h>
#include "invoke/call_executor.hpp"
#include "core/odbc_error.hpp"
#include "core/string_utils.hpp"
#include "fakes.hpp"
#include <cstdlib>

using namespace sproc_mapper::invoke;
using sproc_mapper::core::ConnectionError;
using sproc_mapper::core::ProcedureError;
using sproc_mapper::test::FakeResult;
using sproc_mapper::test::FakeStatement;

namespace {

const char* live_connection() {
    return std::getenv("SPROC_MAPPER_ODBC_CONNECTION");
}

// Text of a cell, std::nullopt for SQL NULL or a missing column
std::optional<std::string> cell(const sproc_mapper::mapping::RawRow& row, const std::string& column) {
    const auto* found = row.find(column);
    return found ? found->value : std::nullopt;
}

} // anonymous namespace

TEST(OdbcCallExecutorTest, UnreachableDriverRaisesConnectionError) {
    OdbcCallExecutor executor;
    ProcedureCall call{"GetUsers", {}, Cardinality::Many};

    EXPECT_THROW(executor.execute("Driver={No Such Driver 0xDEAD};Server=nowhere", call),
                 ConnectionError);
}

TEST(OdbcCallExecutorTest, UnknownProcedureRaisesProcedureError) {
    const char* conn_str = live_connection();
    if (!conn_str) {
        GTEST_SKIP() << "SPROC_MAPPER_ODBC_CONNECTION not set";
    }

    OdbcCallExecutor executor;
    ProcedureCall call{"sproc_mapper_no_such_procedure", {{"id", std::int64_t{1}}}, Cardinality::Many};

    try {
        executor.execute(conn_str, call);
        FAIL() << "expected ProcedureError";
    } catch (const ProcedureError& e) {
        EXPECT_EQ(e.procedure(), "sproc_mapper_no_such_procedure");
        EXPECT_FALSE(e.diagnostics().empty());
    }
}

// Runs SPROC_MAPPER_TEST_PROCEDURE (no parameters) against the live database
TEST(OdbcCallExecutorTest, LiveProcedureReturnsRows) {
    const char* conn_str = live_connection();
    const char* procedure = std::getenv("SPROC_MAPPER_TEST_PROCEDURE");
    if (!conn_str || !procedure) {
        GTEST_SKIP() << "SPROC_MAPPER_ODBC_CONNECTION / SPROC_MAPPER_TEST_PROCEDURE not set";
    }

    OdbcCallExecutor executor;

    ProcedureCall many{procedure, {}, Cardinality::Many};
    auto rows = executor.execute(conn_str, many);
    for (const auto& row : rows) {
        for (const auto& cell : row.cells()) {
            EXPECT_EQ(cell.column, sproc_mapper::core::to_lower(cell.column));
        }
    }

    ProcedureCall one{procedure, {}, Cardinality::One};
    EXPECT_LE(executor.execute(conn_str, one).size(), rows.size());

    ProcedureCall none{procedure, {}, Cardinality::None};
    EXPECT_TRUE(executor.execute(conn_str, none).empty());
}

TEST(RunCallTest, BindsNamedParametersAndExecutesOnce) {
    FakeStatement stmt({FakeResult::row_count()});
    ProcedureCall call{"DeleteUser",
                       {{"id", std::int64_t{42}}, {"name", std::string("alice")}},
                       Cardinality::None};

    auto rows = run_call(stmt, call, InvokerOptions{});

    EXPECT_TRUE(rows.empty());
    EXPECT_EQ(stmt.prepared_sql, "{CALL DeleteUser(?, ?)}");
    EXPECT_EQ(stmt.executions, 1);
    ASSERT_EQ(stmt.sent.size(), 2u);
    EXPECT_EQ(stmt.sent[0].name, "@id");
    EXPECT_EQ(stmt.sent[0].integer, 42);
    EXPECT_EQ(stmt.sent[1].name, "@name");
    EXPECT_EQ(stmt.sent[1].text, "alice");
    EXPECT_FALSE(stmt.requested_max_rows.has_value());
}

TEST(RunCallTest, SkipsRowCountsBeforeResultSet) {
    FakeStatement stmt({
        FakeResult::row_count(),
        FakeResult::row_count(),
        FakeResult::result_set({"ID", "Name"}, {{"1", "alice"}, {"2", std::nullopt}}),
    });
    ProcedureCall call{"GetUsers", {}, Cardinality::Many};

    auto rows = run_call(stmt, call, InvokerOptions{});

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(cell(rows[0], "id"), std::optional<std::string>("1"));
    ASSERT_NE(rows[1].find("name"), nullptr);
    EXPECT_EQ(cell(rows[1], "name"), std::nullopt);
}

TEST(RunCallTest, ReadsOnlyFirstResultSetAndConsumesTheRest) {
    FakeStatement stmt({
        FakeResult::result_set({"id"}, {{"1"}}),
        FakeResult::result_set({"other"}, {{"x"}, {"y"}}),
        FakeResult::row_count(),
    });
    ProcedureCall call{"GetUsers", {}, Cardinality::Many};

    auto rows = run_call(stmt, call, InvokerOptions{});

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(cell(rows[0], "id"), std::optional<std::string>("1"));
    EXPECT_FALSE(rows[0].contains("other"));
    // Two further results plus the final SQL_NO_DATA
    EXPECT_EQ(stmt.more_results_calls, 3);
}

TEST(RunCallTest, ErrorInLaterResultFailsManyCall) {
    FakeStatement stmt({
        FakeResult::result_set({"id"}, {{"1"}}),
        FakeResult::failure("23000", "Cannot insert duplicate key"),
    });
    ProcedureCall call{"SaveAndList", {}, Cardinality::Many};

    try {
        run_call(stmt, call, InvokerOptions{});
        FAIL() << "expected ProcedureError";
    } catch (const ProcedureError& e) {
        EXPECT_EQ(e.procedure(), "SaveAndList");
        EXPECT_EQ(e.sqlstate(), "23000");
        EXPECT_NE(std::string(e.what()).find("duplicate key"), std::string::npos);
    }
}

TEST(RunCallTest, ErrorInLaterResultFailsNoResultCall) {
    FakeStatement stmt({
        FakeResult::row_count(),
        FakeResult::row_count(),
        FakeResult::failure("40001", "Transaction was deadlocked"),
    });
    ProcedureCall call{"ArchiveOrders", {}, Cardinality::None};

    try {
        run_call(stmt, call, InvokerOptions{});
        FAIL() << "expected ProcedureError";
    } catch (const ProcedureError& e) {
        EXPECT_EQ(e.procedure(), "ArchiveOrders");
        EXPECT_EQ(e.sqlstate(), "40001");
    }
}

TEST(RunCallTest, ExecuteFailureBecomesProcedureError) {
    FakeStatement stmt({FakeResult::failure("42000", "Could not find stored procedure")});
    ProcedureCall call{"Missing", {}, Cardinality::One};

    EXPECT_THROW(run_call(stmt, call, InvokerOptions{}), ProcedureError);
}

TEST(RunCallTest, SingleRowCallLimitsRows) {
    FakeStatement stmt({FakeResult::result_set({"id"}, {{"7"}})});
    ProcedureCall call{"GetUser", {{"id", std::int64_t{7}}}, Cardinality::One};

    auto rows = run_call(stmt, call, InvokerOptions{});

    ASSERT_TRUE(stmt.requested_max_rows.has_value());
    EXPECT_EQ(*stmt.requested_max_rows, 1u);
    ASSERT_EQ(rows.size(), 1u);
}

TEST(RunCallTest, RefusedRowLimitIsNotAnError) {
    FakeStatement stmt({FakeResult::result_set({"id"}, {{"7"}})});
    stmt.accept_max_rows = false;
    ProcedureCall call{"GetUser", {}, Cardinality::One};

    EXPECT_EQ(run_call(stmt, call, InvokerOptions{}).size(), 1u);
}

TEST(RunCallTest, NoResultSetGivesNoRows) {
    FakeStatement stmt({FakeResult::row_count()});
    ProcedureCall call{"GetUsers", {}, Cardinality::Many};

    EXPECT_TRUE(run_call(stmt, call, InvokerOptions{}).empty());
}

TEST(RunCallTest, TextChunkSizeReachesStatement) {
    FakeStatement stmt({FakeResult::result_set({"id"}, {{"1"}})});
    InvokerOptions options;
    options.text_chunk_size = 64;
    ProcedureCall call{"GetUsers", {}, Cardinality::Many};

    run_call(stmt, call, options);

    ASSERT_EQ(stmt.chunk_sizes.size(), 1u);
    EXPECT_EQ(stmt.chunk_sizes[0], 64u);
}
