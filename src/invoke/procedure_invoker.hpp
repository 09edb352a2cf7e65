#pragma once

#include "call_executor.hpp"
#include "connection_catalog.hpp"
#include "parameter.hpp"
#include "procedure_call.hpp"
#include "core/logger.hpp"
#include "mapping/object_mapper.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sproc_mapper::invoke {

/**
 * @brief Entry point: call a stored procedure, get typed objects back
 *
 * Every call opens and releases its own connection and shares no state
 * with other calls. Connection and procedure failures propagate as
 * core::ConnectionError / core::ProcedureError; a cell that cannot be
 * coerced only leaves its field at the default value (see MappedRow).
 *
 * Usage:
 *   ProcedureInvoker db;
 *   auto user  = db.fetch_one<User>(conn, UserKey{42}, "GetUser");
 *   auto users = db.fetch_many<User>(conn, "GetUsers");
 *   db.run(conn, UserKey{42}, "DeleteUser");
 *
 * fetch_one keeps only the first row when the procedure returns several;
 * the extra rows are not treated as an error.
 */
class ProcedureInvoker {
public:
    ProcedureInvoker();
    explicit ProcedureInvoker(InvokerOptions options);
    explicit ProcedureInvoker(std::shared_ptr<CallExecutor> executor);

    // Resolve connection names through a catalog before each call
    void set_catalog(ConnectionCatalog catalog);

    template <typename T>
    std::optional<T> fetch_one(const std::string& connection, const std::string& procedure) {
        return fetch_one<T>(connection, ParameterList{}, procedure);
    }

    template <typename T, typename Params>
    std::optional<T> fetch_one(const std::string& connection, const Params& params,
                               const std::string& procedure) {
        auto mapped = fetch_one_with_report<T>(connection, params, procedure);
        if (!mapped) {
            return std::nullopt;
        }
        return std::move(mapped->value);
    }

    template <typename T>
    std::vector<T> fetch_many(const std::string& connection, const std::string& procedure) {
        return fetch_many<T>(connection, ParameterList{}, procedure);
    }

    template <typename T, typename Params>
    std::vector<T> fetch_many(const std::string& connection, const Params& params,
                              const std::string& procedure) {
        return mapping::values_of(fetch_many_with_report<T>(connection, params, procedure));
    }

    void run(const std::string& connection, const std::string& procedure) {
        run(connection, ParameterList{}, procedure);
    }

    template <typename Params>
    void run(const std::string& connection, const Params& params, const std::string& procedure) {
        execute(connection, procedure, to_parameters(params), Cardinality::None);
    }

    template <typename T, typename Params>
    std::optional<mapping::MappedRow<T>> fetch_one_with_report(const std::string& connection,
                                                               const Params& params,
                                                               const std::string& procedure) {
        auto rows = execute(connection, procedure, to_parameters(params), Cardinality::One);
        if (rows.empty()) {
            return std::nullopt;
        }
        LOG_IF(rows.size() > 1, procedure + " returned " + std::to_string(rows.size()) +
               " rows, keeping the first");

        mapping::ObjectMapper<T> mapper(mapping::describe<T>(), rows.front());
        return mapper.map(rows.front());
    }

    template <typename T, typename Params>
    std::vector<mapping::MappedRow<T>> fetch_many_with_report(const std::string& connection,
                                                              const Params& params,
                                                              const std::string& procedure) {
        auto rows = execute(connection, procedure, to_parameters(params), Cardinality::Many);
        return mapping::map_rows<T>(rows);
    }

    // Raw rows without mapping
    mapping::RowSet fetch_rows(const std::string& connection, const ParameterList& params,
                               const std::string& procedure, Cardinality cardinality);

private:
    mapping::RowSet execute(const std::string& connection, const std::string& procedure,
                            ParameterList params, Cardinality cardinality);

    std::shared_ptr<CallExecutor> executor_;
    std::optional<ConnectionCatalog> catalog_;
};

} // namespace sproc_mapper::invoke
