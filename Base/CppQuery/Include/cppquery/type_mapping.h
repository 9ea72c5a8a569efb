#ifndef cppquery_TYPE_MAPPING_H
#define cppquery_TYPE_MAPPING_H

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cppquery/error.h"
#include "cppquery/logical_type.h"
#include "cppquery/value.h"
#include "cppquery_sqldriver/sql_value.h"

namespace cppquery {

    // 单个 (方言, 逻辑类型) 的映射条目
    struct TypeMapping {
        std::string native_column_type;  // 建表时使用的列类型
        std::function<std::expected<cppquery_sqldriver::SqlValue, Error>(const Value&)> to_database;
        std::function<std::expected<Value, Error>(const cppquery_sqldriver::SqlValue&)> to_native;
    };

    // 显式构造的类型映射注册表, 由方言与存储后端按引用共享.
    // 初始化后以读为主, 所有访问都经过互斥锁
    class TypeMappingRegistry {
      public:
        TypeMappingRegistry() = default;
        TypeMappingRegistry(const TypeMappingRegistry&) = delete;
        TypeMappingRegistry& operator=(const TypeMappingRegistry&) = delete;

        // 注册 sqlite / mysql / postgresql 的内置映射
        static std::shared_ptr<TypeMappingRegistry> createWithBuiltins();

        // 同一 (方言, 类型) 只能有一个条目, 重复注册返回 ConstructionError
        std::expected<void, Error> registerMapping(const std::string& dialect, LogicalType type, TypeMapping mapping);
        // 覆盖已有条目 (用于测试或自定义编码)
        void replaceMapping(const std::string& dialect, LogicalType type, TypeMapping mapping);
        bool removeMapping(const std::string& dialect, LogicalType type);

        // 声明类型 (例如 "VARCHAR(255)") 到逻辑类型的推断规则, 按基础类型名匹配
        void registerDeclaredType(const std::string& dialect, const std::string& declared_base_type, LogicalType type);
        std::optional<LogicalType> logicalTypeForDeclaredType(const std::string& dialect, const std::string& declared_type) const;

        bool hasMapping(const std::string& dialect, LogicalType type) const;
        std::vector<LogicalType> missingTypes(const std::string& dialect) const;
        bool isComplete(const std::string& dialect) const;
        std::vector<std::string> dialects() const;

        std::expected<std::string, Error> nativeColumnType(const std::string& dialect, LogicalType type) const;
        std::expected<cppquery_sqldriver::SqlValue, Error> toDatabase(const std::string& dialect, const Value& value, LogicalType type) const;
        std::expected<Value, Error> toNative(const std::string& dialect, const cppquery_sqldriver::SqlValue& value, LogicalType type) const;

      private:
        std::optional<TypeMapping> find(const std::string& dialect, LogicalType type) const;

        mutable std::mutex mutex_;
        std::map<std::pair<std::string, LogicalType>, TypeMapping> mappings_;
        std::map<std::pair<std::string, std::string>, LogicalType> declared_types_;
    };

    // 无类型信息时按驱动值的存储类别给出默认应用值
    Value defaultNativeValue(const cppquery_sqldriver::SqlValue& value);

    namespace type_mapping_builtins {
        void registerSqlite(TypeMappingRegistry& registry);
        void registerMySql(TypeMappingRegistry& registry);
        void registerPostgres(TypeMappingRegistry& registry);
    }  // namespace type_mapping_builtins

}  // namespace cppquery

#endif  // cppquery_TYPE_MAPPING_H
