#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace vaultagent {

namespace {

DbResultSet failed(std::string message) {
    DbResultSet result;
    result.success = false;
    result.error_message = utils::trim(message);
    return result;
}

} // anonymous namespace

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return failed("Connection is closed");
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    if (!res) {
        return failed(PQerrorMessage(conn_));
    }

    DbResultSet result;
    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
            result = from_tuples(res);
            break;
        case PGRES_COMMAND_OK:
            result = from_command(res);
            break;
        default:
            result = failed(PQerrorMessage(conn_));
            break;
    }
    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& probe) {
    if (!is_connected()) {
        return false;
    }

    PGresult* res = PQexec(conn_, probe.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::from_tuples(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            const char* val = PQgetvalue(res, i, j);
            row.emplace_back(val ? val : "");
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

DbResultSet PgConnection::from_command(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }
    return result;
}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        utils::log::error("PostgreSQL: failed to allocate connection");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("PostgreSQL: connect failed: {}",
            utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace vaultagent
