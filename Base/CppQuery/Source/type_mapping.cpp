// cppquery/type_mapping.cpp
#include "cppquery/type_mapping.h"

#include <algorithm>
#include <cctype>

namespace cppquery {

    namespace {
        std::string lowerCopy(const std::string& s) {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string upperCopy(const std::string& s) {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        std::string trimCopy(const std::string& s) {
            size_t begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        Error missingMappingError(const std::string& dialect, LogicalType type) {
            return makeConstructionError(std::string("No type mapping registered for logical type ") + logicalTypeName(type), "", dialect);
        }
    }  // namespace

    std::shared_ptr<TypeMappingRegistry> TypeMappingRegistry::createWithBuiltins() {
        auto registry = std::make_shared<TypeMappingRegistry>();
        type_mapping_builtins::registerSqlite(*registry);
        type_mapping_builtins::registerMySql(*registry);
        type_mapping_builtins::registerPostgres(*registry);
        return registry;
    }

    std::expected<void, Error> TypeMappingRegistry::registerMapping(const std::string& dialect, LogicalType type, TypeMapping mapping) {
        if (!mapping.to_database || !mapping.to_native) {
            return std::unexpected(makeConstructionError(std::string("Type mapping for ") + logicalTypeName(type) + " must provide both conversion directions", "", dialect));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::make_pair(lowerCopy(dialect), type);
        if (mappings_.count(key)) {
            return std::unexpected(makeConstructionError(std::string("Type mapping for ") + logicalTypeName(type) + " is already registered", "", dialect));
        }
        mappings_.emplace(std::move(key), std::move(mapping));
        return {};
    }

    void TypeMappingRegistry::replaceMapping(const std::string& dialect, LogicalType type, TypeMapping mapping) {
        std::lock_guard<std::mutex> lock(mutex_);
        mappings_[std::make_pair(lowerCopy(dialect), type)] = std::move(mapping);
    }

    bool TypeMappingRegistry::removeMapping(const std::string& dialect, LogicalType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        return mappings_.erase(std::make_pair(lowerCopy(dialect), type)) > 0;
    }

    void TypeMappingRegistry::registerDeclaredType(const std::string& dialect, const std::string& declared_base_type, LogicalType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        declared_types_[std::make_pair(lowerCopy(dialect), upperCopy(trimCopy(declared_base_type)))] = type;
    }

    std::optional<LogicalType> TypeMappingRegistry::logicalTypeForDeclaredType(const std::string& dialect, const std::string& declared_type) const {
        std::string decl = upperCopy(trimCopy(declared_type));
        if (decl.empty()) {
            return std::nullopt;
        }
        // "DECIMAL(10,2)" -> "DECIMAL", "DOUBLE PRECISION" 先整体匹配再取首词
        auto paren = decl.find('(');
        std::string base = trimCopy(paren == std::string::npos ? decl : decl.substr(0, paren));
        std::string first_word = base.substr(0, base.find(' '));

        std::lock_guard<std::mutex> lock(mutex_);
        const std::string dialect_key = lowerCopy(dialect);
        if (paren != std::string::npos) {
            auto exact = declared_types_.find(std::make_pair(dialect_key, decl));
            if (exact != declared_types_.end()) return exact->second;
        }
        auto it = declared_types_.find(std::make_pair(dialect_key, base));
        if (it != declared_types_.end()) return it->second;
        it = declared_types_.find(std::make_pair(dialect_key, first_word));
        if (it != declared_types_.end()) return it->second;
        return std::nullopt;
    }

    std::optional<TypeMapping> TypeMappingRegistry::find(const std::string& dialect, LogicalType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mappings_.find(std::make_pair(lowerCopy(dialect), type));
        if (it == mappings_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool TypeMappingRegistry::hasMapping(const std::string& dialect, LogicalType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mappings_.count(std::make_pair(lowerCopy(dialect), type)) > 0;
    }

    std::vector<LogicalType> TypeMappingRegistry::missingTypes(const std::string& dialect) const {
        std::vector<LogicalType> missing;
        for (LogicalType type : kAllLogicalTypes) {
            if (!hasMapping(dialect, type)) {
                missing.push_back(type);
            }
        }
        return missing;
    }

    bool TypeMappingRegistry::isComplete(const std::string& dialect) const {
        return missingTypes(dialect).empty();
    }

    std::vector<std::string> TypeMappingRegistry::dialects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [key, mapping] : mappings_) {
            if (names.empty() || names.back() != key.first) {
                names.push_back(key.first);
            }
        }
        return names;
    }

    std::expected<std::string, Error> TypeMappingRegistry::nativeColumnType(const std::string& dialect, LogicalType type) const {
        auto mapping = find(dialect, type);
        if (!mapping) {
            return std::unexpected(missingMappingError(dialect, type));
        }
        return mapping->native_column_type;
    }

    std::expected<cppquery_sqldriver::SqlValue, Error> TypeMappingRegistry::toDatabase(const std::string& dialect, const Value& value, LogicalType type) const {
        if (isNull(value)) {
            return cppquery_sqldriver::SqlValue();
        }
        auto mapping = find(dialect, type);
        if (!mapping) {
            return std::unexpected(missingMappingError(dialect, type));
        }
        auto converted = mapping->to_database(value);
        if (!converted) {
            Error err = converted.error();
            if (err.dialect.empty()) err.dialect = lowerCopy(dialect);
            return std::unexpected(err);
        }
        return converted;
    }

    std::expected<Value, Error> TypeMappingRegistry::toNative(const std::string& dialect, const cppquery_sqldriver::SqlValue& value, LogicalType type) const {
        if (value.isNull()) {
            return Value(nullptr);
        }
        auto mapping = find(dialect, type);
        if (!mapping) {
            return std::unexpected(missingMappingError(dialect, type));
        }
        auto converted = mapping->to_native(value);
        if (!converted) {
            Error err = converted.error();
            if (err.dialect.empty()) err.dialect = lowerCopy(dialect);
            return std::unexpected(err);
        }
        return converted;
    }

    Value defaultNativeValue(const cppquery_sqldriver::SqlValue& value) {
        using cppquery_sqldriver::SqlValueType;
        switch (value.type()) {
            case SqlValueType::Null:
                return nullptr;
            case SqlValueType::Bool:
                return value.toBool();
            case SqlValueType::Int64:
                return static_cast<long long>(value.toInt64());
            case SqlValueType::Double:
                return value.toDouble();
            case SqlValueType::String:
                return value.toString();
            case SqlValueType::ByteArray: {
                auto bytes = value.toBytes();
                return QByteArray(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size()));
            }
        }
        return nullptr;
    }

}  // namespace cppquery
