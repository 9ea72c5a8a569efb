// SqlDriver/Source/sql_driver_registry.cpp
#include "cppquery_sqldriver/sql_driver_registry.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <mutex>

#include "cppquery_sqldriver/i_sql_driver.h"
#include "cppquery_sqldriver/sqlite/sqlite_driver.h"

namespace cppquery_sqldriver {

    std::string SqlDriverRegistry::normalizeName(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }

    bool SqlDriverRegistry::registerDriver(const std::string& driverName, DriverFactory factory) {
        if (driverName.empty() || !factory) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.emplace(normalizeName(driverName), std::move(factory)).second;
    }

    bool SqlDriverRegistry::unregisterDriver(const std::string& driverName) {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.erase(normalizeName(driverName)) > 0;
    }

    std::vector<std::string> SqlDriverRegistry::drivers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> driver_names;
        driver_names.reserve(factories_.size());
        for (const auto& pair : factories_) {
            driver_names.push_back(pair.first);
        }
        return driver_names;
    }

    bool SqlDriverRegistry::isDriverAvailable(const std::string& driverName) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.count(normalizeName(driverName)) > 0;
    }

    std::unique_ptr<ISqlDriver> SqlDriverRegistry::createDriver(const std::string& driverName) const {
        DriverFactory factory_to_call = nullptr;
        {  // Scope for lock
            std::lock_guard<std::mutex> lock(mutex_);
            auto factory_it = factories_.find(normalizeName(driverName));
            if (factory_it == factories_.end()) {
                return nullptr;
            }
            factory_to_call = factory_it->second;
        }  // Mutex released here, the factory runs outside the lock
        return factory_to_call();
    }

    std::unique_ptr<SqlDriverRegistry> SqlDriverRegistry::createWithBuiltinDrivers() {
        auto registry = std::make_unique<SqlDriverRegistry>();
        if (!SqliteDriver_Register(*registry)) {
            return nullptr;
        }
        return registry;
    }

}  // namespace cppquery_sqldriver
