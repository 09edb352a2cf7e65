#include "procedure_invoker.hpp"
#include <stdexcept>

namespace sproc_mapper::invoke {

ProcedureInvoker::ProcedureInvoker()
    : ProcedureInvoker(InvokerOptions{}) {
}

ProcedureInvoker::ProcedureInvoker(InvokerOptions options)
    : executor_(std::make_shared<OdbcCallExecutor>(std::move(options))) {
}

ProcedureInvoker::ProcedureInvoker(std::shared_ptr<CallExecutor> executor)
    : executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("ProcedureInvoker needs a call executor");
    }
}

void ProcedureInvoker::set_catalog(ConnectionCatalog catalog) {
    catalog_ = std::move(catalog);
}

mapping::RowSet ProcedureInvoker::fetch_rows(const std::string& connection, const ParameterList& params,
                                             const std::string& procedure, Cardinality cardinality) {
    return execute(connection, procedure, params, cardinality);
}

mapping::RowSet ProcedureInvoker::execute(const std::string& connection, const std::string& procedure,
                                          ParameterList params, Cardinality cardinality) {
    if (procedure.empty()) {
        throw std::invalid_argument("Procedure name must not be empty");
    }

    ProcedureCall call;
    call.procedure = procedure;
    call.parameters = std::move(params);
    call.cardinality = cardinality;

    const std::string resolved = catalog_ ? catalog_->resolve(connection) : connection;
    return executor_->execute(resolved, call);
}

} // namespace sproc_mapper::invoke
