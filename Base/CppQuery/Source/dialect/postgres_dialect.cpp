// cppquery/dialect/postgres_dialect.cpp
#include "cppquery/dialect/postgres_dialect.h"

namespace cppquery {

    PostgresDialect::PostgresDialect(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry) : BaseDialect(NAME, version, std::move(registry), PlaceholderStyle::Numbered) {
    }

    std::expected<std::shared_ptr<const PostgresDialect>, Error> PostgresDialect::create(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry) {
        auto valid = validateRegistry(NAME, registry);
        if (!valid) {
            return std::unexpected(valid.error());
        }
        return std::shared_ptr<const PostgresDialect>(new PostgresDialect(version, std::move(registry)));
    }

    bool PostgresDialect::supports(DialectFeature /*feature*/) const {
        return true;
    }

}  // namespace cppquery
