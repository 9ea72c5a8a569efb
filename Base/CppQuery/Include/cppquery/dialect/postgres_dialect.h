#ifndef cppquery_POSTGRES_DIALECT_H
#define cppquery_POSTGRES_DIALECT_H

#include "cppquery/dialect/base_dialect.h"

namespace cppquery {

    class PostgresDialect : public BaseDialect {
      public:
        static constexpr const char* NAME = "postgresql";

        static std::expected<std::shared_ptr<const PostgresDialect>, Error> create(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry);

        bool supports(DialectFeature feature) const override;

      private:
        PostgresDialect(DialectVersion version, std::shared_ptr<const TypeMappingRegistry> registry);
    };

}  // namespace cppquery

#endif  // cppquery_POSTGRES_DIALECT_H
