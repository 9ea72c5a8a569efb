// SqlDriver/Source/sql_record.cpp
#include "cppquery_sqldriver/sql_record.h"

#include <stdexcept>
#include <utility>

namespace cppquery_sqldriver {

    const SqlField& SqlRecord::field(int index) const {
        if (index < 0 || index >= count()) {
            throw std::out_of_range("SqlRecord::field: index " + std::to_string(index) + " out of range (" + std::to_string(count()) + " columns)");
        }
        return fields_[static_cast<std::size_t>(index)];
    }

    std::string SqlRecord::fieldName(int index) const {
        if (index < 0 || index >= count()) return std::string();
        return fields_[static_cast<std::size_t>(index)].name();
    }

    std::optional<int> SqlRecord::indexOf(const std::string& name) const {
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i].name() == name) return static_cast<int>(i);
        }
        return std::nullopt;
    }

    SqlValue SqlRecord::value(int index) const {
        if (index < 0 || index >= count()) return SqlValue();
        return fields_[static_cast<std::size_t>(index)].value();
    }

    SqlValue SqlRecord::value(const std::string& name) const {
        auto index = indexOf(name);
        return index ? value(*index) : SqlValue();
    }

    bool SqlRecord::isNull(const std::string& name) const {
        return value(name).isNull();
    }

    void SqlRecord::append(SqlField field) {
        fields_.push_back(std::move(field));
    }

    void SqlRecord::setValue(int index, SqlValue value) {
        if (index >= 0 && index < count()) {
            fields_[static_cast<std::size_t>(index)].setValue(std::move(value));
        }
    }

}  // namespace cppquery_sqldriver
