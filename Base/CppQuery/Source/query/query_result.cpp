// cppquery/query/query_result.cpp
#include "cppquery/query/query_result.h"

#include <stdexcept>

namespace cppquery {

    const char* statementKindName(StatementKind kind) {
        switch (kind) {
            case StatementKind::Select:
                return "SELECT";
            case StatementKind::Insert:
                return "INSERT";
            case StatementKind::Update:
                return "UPDATE";
            case StatementKind::Delete:
                return "DELETE";
            case StatementKind::DDL:
                return "DDL";
            case StatementKind::TransactionControl:
                return "TRANSACTION";
            case StatementKind::Other:
                return "OTHER";
        }
        return "OTHER";
    }

    Row::Row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<Value> values) : columns_(std::move(columns)), values_(std::move(values)) {
    }

    const std::vector<std::string>& Row::columns() const {
        static const std::vector<std::string> empty;
        return columns_ ? *columns_ : empty;
    }

    const Value& Row::at(std::size_t index) const {
        if (index >= values_.size()) {
            throw std::out_of_range("cppquery::Row::at: column index " + std::to_string(index) + " out of range (" + std::to_string(values_.size()) + " columns)");
        }
        return values_[index];
    }

    bool Row::contains(const std::string& column) const {
        return find(column) != nullptr;
    }

    const Value* Row::find(const std::string& column) const {
        if (!columns_) return nullptr;
        const auto& names = *columns_;
        for (std::size_t i = 0; i < names.size() && i < values_.size(); ++i) {
            if (names[i] == column) {
                return &values_[i];
            }
        }
        return nullptr;
    }

}  // namespace cppquery
