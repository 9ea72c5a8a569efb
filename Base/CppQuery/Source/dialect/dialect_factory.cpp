// cppquery/dialect/dialect_factory.cpp
#include "cppquery/dialect/dialect_factory.h"

#include <algorithm>
#include <cctype>

#include "cppquery/dialect/mysql_dialect.h"
#include "cppquery/dialect/postgres_dialect.h"
#include "cppquery/dialect/sqlite_dialect.h"

namespace cppquery {

    std::string dialectNameForDriver(const std::string& driver_type) {
        std::string lowered = driver_type;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "sqlite" || lowered == "sqlite3" || lowered == "qsqlite") {
            return SqliteDialect::NAME;
        }
        if (lowered == "mysql" || lowered == "mariadb" || lowered == "qmysql") {
            return MySqlDialect::NAME;
        }
        if (lowered == "postgresql" || lowered == "postgres" || lowered == "psql" || lowered == "qpsql") {
            return PostgresDialect::NAME;
        }
        return {};
    }

    std::expected<DialectPtr, Error> makeDialect(const std::string& driver_type, const DialectVersion& version, std::shared_ptr<const TypeMappingRegistry> registry) {
        const std::string name = dialectNameForDriver(driver_type);
        if (name == SqliteDialect::NAME) {
            auto dialect = SqliteDialect::create(version, std::move(registry));
            if (!dialect) return std::unexpected(dialect.error());
            return DialectPtr(*dialect);
        }
        if (name == MySqlDialect::NAME) {
            auto dialect = MySqlDialect::create(version, std::move(registry));
            if (!dialect) return std::unexpected(dialect.error());
            return DialectPtr(*dialect);
        }
        if (name == PostgresDialect::NAME) {
            auto dialect = PostgresDialect::create(version, std::move(registry));
            if (!dialect) return std::unexpected(dialect.error());
            return DialectPtr(*dialect);
        }
        return std::unexpected(Error(ErrorCode::InvalidConfiguration, "No dialect available for driver type '" + driver_type + "'"));
    }

}  // namespace cppquery
