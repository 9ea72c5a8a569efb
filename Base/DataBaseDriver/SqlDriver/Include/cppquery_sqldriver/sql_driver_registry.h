// cppquery_sqldriver/sql_driver_registry.h
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cppquery_sqldriver {

    class ISqlDriver;

    // 驱动工厂注册表. 显式构造并按引用传递, 不存在进程级单例
    class SqlDriverRegistry {
      public:
        using DriverFactory = std::function<std::unique_ptr<ISqlDriver>()>;

        SqlDriverRegistry() = default;
        SqlDriverRegistry(const SqlDriverRegistry&) = delete;
        SqlDriverRegistry& operator=(const SqlDriverRegistry&) = delete;

        // 返回 false 表示同名驱动已注册
        bool registerDriver(const std::string& driverName, DriverFactory factory);
        bool unregisterDriver(const std::string& driverName);

        std::vector<std::string> drivers() const;
        bool isDriverAvailable(const std::string& driverName) const;

        // 未注册或工厂失败时返回 nullptr
        std::unique_ptr<ISqlDriver> createDriver(const std::string& driverName) const;

        // 注册随库提供的驱动 (目前为 SQLITE)
        static std::unique_ptr<SqlDriverRegistry> createWithBuiltinDrivers();

      private:
        static std::string normalizeName(const std::string& name);

        mutable std::mutex mutex_;
        std::map<std::string, DriverFactory> factories_;
    };

}  // namespace cppquery_sqldriver
