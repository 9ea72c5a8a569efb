#ifndef cppquery_DIALECT_FACTORY_H
#define cppquery_DIALECT_FACTORY_H

#include <expected>
#include <memory>
#include <string>

#include "cppquery/dialect/dialect.h"
#include "cppquery/error.h"

namespace cppquery {

    class TypeMappingRegistry;

    // 按驱动类型 ("SQLITE", "mysql", "postgresql" ...) 构造并校验方言
    std::expected<DialectPtr, Error> makeDialect(const std::string& driver_type, const DialectVersion& version, std::shared_ptr<const TypeMappingRegistry> registry);

    // 规范化后的方言名, 未知驱动返回空串
    std::string dialectNameForDriver(const std::string& driver_type);

}  // namespace cppquery

#endif  // cppquery_DIALECT_FACTORY_H
