#include <gtest/gtest.h>
#include "core/odbc_error.hpp"

using namespace sproc_mapper::core;

namespace {

std::vector<OdbcDiagnostic> sample_diagnostics() {
    std::vector<OdbcDiagnostic> diags;

    OdbcDiagnostic diag1;
    diag1.sqlstate = "08001";
    diag1.native_error = 12345;
    diag1.message = "Connection failed";
    diag1.record_number = 1;
    diags.push_back(diag1);

    OdbcDiagnostic diag2;
    diag2.sqlstate = "01000";
    diag2.message = "General warning";
    diag2.record_number = 2;
    diags.push_back(diag2);

    return diags;
}

} // anonymous namespace

TEST(OdbcErrorTest, ConstructWithMessage) {
    OdbcError error("Test error");
    EXPECT_STREQ(error.what(), "Test error");
}

TEST(OdbcErrorTest, DiagnosticsEmpty) {
    OdbcError error("Test error");
    EXPECT_TRUE(error.diagnostics().empty());
    EXPECT_TRUE(error.sqlstate().empty());
}

TEST(OdbcErrorTest, FormatDiagnostics) {
    OdbcError error("Connection error", sample_diagnostics());

    std::string formatted = error.format_diagnostics();
    EXPECT_NE(formatted.find("08001"), std::string::npos);
    EXPECT_NE(formatted.find("12345"), std::string::npos);
    EXPECT_NE(formatted.find("Connection failed"), std::string::npos);
    EXPECT_NE(formatted.find("General warning"), std::string::npos);
}

TEST(OdbcErrorTest, SqlstateIsFirstRecord) {
    OdbcError error("Connection error", sample_diagnostics());
    EXPECT_EQ(error.sqlstate(), "08001");
}

TEST(ConnectionErrorTest, IsAnOdbcError) {
    try {
        throw ConnectionError("Unreachable server", sample_diagnostics());
    } catch (const OdbcError& e) {
        EXPECT_STREQ(e.what(), "Unreachable server");
        EXPECT_EQ(e.diagnostics().size(), 2u);
        return;
    }
    FAIL() << "ConnectionError was not caught as OdbcError";
}

TEST(ProcedureErrorTest, CarriesProcedureName) {
    ProcedureError error("GetUser", "GetUser: syntax error", sample_diagnostics());
    EXPECT_EQ(error.procedure(), "GetUser");
    EXPECT_STREQ(error.what(), "GetUser: syntax error");
    EXPECT_EQ(error.sqlstate(), "08001");
}

TEST(ProcedureErrorTest, DiagnosticsOptional) {
    ProcedureError error("DeleteUser", "rejected");
    EXPECT_TRUE(error.diagnostics().empty());

    const OdbcError& base = error;
    EXPECT_STREQ(base.what(), "rejected");
}

TEST(CheckResultTest, SuccessDoesNotThrow) {
    EXPECT_NO_THROW(check_odbc_result(SQL_SUCCESS, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "noop"));
    EXPECT_NO_THROW(check_odbc_result(SQL_SUCCESS_WITH_INFO, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "noop"));
    EXPECT_NO_THROW(check_connection_result(SQL_SUCCESS, SQL_HANDLE_DBC, SQL_NULL_HANDLE, "noop"));
}

TEST(CheckResultTest, ConnectionFailureRaisesConnectionError) {
    EXPECT_THROW(check_connection_result(SQL_ERROR, SQL_HANDLE_DBC, SQL_NULL_HANDLE, "connect"),
                 ConnectionError);
}

TEST(CheckResultTest, FailureRaisesOdbcError) {
    EXPECT_THROW(check_odbc_result(SQL_ERROR, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "execute"),
                 OdbcError);
}
