// SqlDriver/Source/sqlite/sqlite_driver_utility.cpp
#include <sqlite3.h>

#include "cppquery_sqldriver/sqlite/sqlite_driver.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver_helper.h"

namespace cppquery_sqldriver {

    namespace sqlite_helper {

        std::string quoteIdentifier(const std::string& identifier) {
            std::string quoted;
            quoted.reserve(identifier.size() + 2);
            quoted.push_back('"');
            for (char c : identifier) {
                if (c == '"') quoted.push_back('"');
                quoted.push_back(c);
            }
            quoted.push_back('"');
            return quoted;
        }

        std::string isolationBeginStatement(TransactionIsolationLevel level) {
            switch (level) {
                case TransactionIsolationLevel::Serializable:
                    return "BEGIN IMMEDIATE TRANSACTION";
                case TransactionIsolationLevel::ReadUncommitted:
                    return "BEGIN DEFERRED TRANSACTION";
                default:
                    return "BEGIN";
            }
        }

    }  // namespace sqlite_helper

    bool SqliteDriver::hasFeature(DriverFeature feature) const {
        switch (feature) {
            case DriverFeature::Transactions:
            case DriverFeature::NamedSavepoints:
            case DriverFeature::IsolationLevels:
            case DriverFeature::LastInsertId:
            case DriverFeature::CancelQuery:
            case DriverFeature::QueryTimeout:
                return true;
            case DriverFeature::Returning:
                return sqlite3_libversion_number() >= 3035000;
            case DriverFeature::ThreadSafe:
                return sqlite3_threadsafe() != 0;
        }
        return false;
    }

    SqlError SqliteDriver::lastError() const {
        return m_last_error_cache;
    }

    std::string SqliteDriver::driverName() const {
        return DRIVER_NAME;
    }

    std::string SqliteDriver::engineVersion() const {
        return sqlite3_libversion();
    }

    std::string SqliteDriver::quoteIdentifier(const std::string& identifier) const {
        return sqlite_helper::quoteIdentifier(identifier);
    }

    void SqliteDriver::interrupt() {
        std::lock_guard<std::mutex> lock(m_handle_mutex);
        if (m_db) {
            sqlite3_interrupt(m_db);
        }
    }

}  // namespace cppquery_sqldriver
