#include <QCoreApplication>
#include <QDebug>
#include <QString>
#include <QStringList>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <iostream>
#include <memory>
#include <vector>

#include "cppquery/backend/async_storage_backend.h"
#include "cppquery/backend/storage_backend.h"
#include "cppquery/expression/expression_builders.h"
#include "cppquery/query/active_query.h"
#include "cppquery/query/cte_query.h"
#include "cppquery/query/dml_query.h"
#include "cppquery/query/set_operation_query.h"
#include "cppquery_sqldriver/sql_driver_registry.h"

using namespace cppquery;

namespace {

    QString errorText(const Error& err) {
        return QString::fromStdString(err.toString());
    }

    void printRows(const std::vector<Row>& rows) {
        for (const auto& row : rows) {
            QStringList parts;
            for (std::size_t i = 0; i < row.size(); ++i) {
                parts << QString::fromStdString(row.columns()[i] + "=" + valueToDebugString(row.values()[i]));
            }
            qDebug().noquote() << "   " << parts.join(", ");
        }
    }

    bool createSchema(StorageBackend& backend) {
        const std::vector<std::string> ddl = {
            "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT NOT NULL, age INTEGER, status TEXT, is_admin BOOLEAN DEFAULT 0, email TEXT UNIQUE)",
            "CREATE TABLE employees (id INTEGER PRIMARY KEY, name TEXT, manager_id INTEGER)",
        };
        for (const auto& sql : ddl) {
            if (auto res = backend.execute(sql); !res) {
                qCritical() << "DDL failed:" << errorText(res.error());
                return false;
            }
        }
        return true;
    }

    void runUserQueries(StorageBackend& backend) {
        qDebug() << "\n--- Inserting users ---";
        auto insert_res = backend.runInTransaction([](StorageBackend& tx) -> std::expected<void, Error> {
            InsertQuery insert(&tx, "users");
            insert.AddRow({{"name", lit("Alice")}, {"age", lit(30)}, {"status", lit("active")}, {"is_admin", lit(true)}, {"email", lit("alice@example.com")}});
            insert.AddRow({{"name", lit("Bob")}, {"age", lit(17)}, {"status", lit("active")}, {"is_admin", lit(false)}, {"email", lit("bob@example.com")}});
            insert.AddRow({{"name", lit("Carol")}, {"age", lit(42)}, {"status", lit("inactive")}, {"is_admin", lit(false)}, {"email", lit("carol@example.com")}});
            auto res = insert.Execute();
            if (!res) return std::unexpected(res.error());
            qDebug() << "Inserted" << res->affected_rows << "users";
            return {};
        });
        if (!insert_res) {
            qCritical() << "Insert failed:" << errorText(insert_res.error());
            return;
        }

        qDebug() << "\n--- Duplicate email is reported as an integrity error ---";
        InsertQuery duplicate(&backend, "users");
        duplicate.Set("name", lit("Mallory")).Set("email", lit("alice@example.com"));
        if (auto dup = duplicate.Execute(); !dup) {
            qInfo() << "Rejected:" << errorText(dup.error()) << "constraint:" << QString::fromStdString(dup.error().constraint_name);
        }

        qDebug() << "\n--- Adult active users ---";
        ActiveQuery adults(&backend, "users");
        adults.Where(ge(col("age"), lit(18))).Where(eq(col("status"), lit("active"))).OrderBy("name").Limit(10);
        if (auto sql = adults.ToSql()) {
            qDebug().noquote() << "SQL:" << QString::fromStdString(sql->sql) << "params:" << sql->params.size();
        }
        if (auto rows = adults.All()) {
            printRows(*rows);
            for (const auto& row : *rows) {
                if (auto admin = row.get<bool>("is_admin")) {
                    qDebug() << "   is_admin decoded as bool:" << *admin;
                }
            }
        } else {
            qCritical() << "Query failed:" << errorText(rows.error());
        }

        ActiveQuery counter(&backend, "users");
        if (auto total = counter.Count()) {
            qDebug() << "Total users:" << *total;
        }

        qDebug() << "\n--- UNION of two filters ---";
        ActiveQuery young(backend.dialect(), "users");
        young.Select({col("name")}).Where(lt(col("age"), lit(18)));
        ActiveQuery inactive(backend.dialect(), "users");
        inactive.Select({col("name")}).Where(eq(col("status"), lit("inactive")));
        auto combined = SetOperationQuery::Create(young, SetOperator::Union, inactive);
        if (combined) {
            combined->OrderBy("name");
            if (auto sql = combined->ToSql()) {
                auto res = backend.execute(*sql);
                if (res) printRows(res->rows);
            }
        }

        qDebug() << "\n--- Lock request on SQLite ---";
        ActiveQuery locked(backend.dialect(), "users");
        locked.LockForUpdate();
        if (auto sql = locked.ToSql(); !sql) {
            qInfo() << "Expected capability error:" << errorText(sql.error());
        }
    }

    void runHierarchyQuery(StorageBackend& backend) {
        qDebug() << "\n--- Recursive CTE over employees ---";
        auto seeded = backend.executeMany("INSERT INTO employees (id, name, manager_id) VALUES (?, ?, ?)",
                                          {{1, "CEO", nullptr}, {2, "CTO", 1}, {3, "Dev Lead", 2}, {4, "Dev", 3}, {5, "CFO", 1}});
        if (!seeded) {
            qCritical() << "Seeding employees failed:" << errorText(seeded.error());
            return;
        }

        ActiveQuery anchor(backend.dialect(), "employees");
        anchor.Select({col("id"), col("name")}).Where(eq(col("manager_id"), lit(1)));
        ActiveQuery recursive(backend.dialect());
        recursive.From("employees", "e").Select({col("e", "id"), col("e", "name")}).JoinCte(JoinType::Inner, "subordinates", eq(col("e", "manager_id"), col("s", "id")), "s");

        ActiveQuery main(backend.dialect());
        main.FromCte("subordinates").Select({col("id"), col("name"), col("cte_depth")}).OrderBy("id");

        CTEQuery cte(&backend);
        cte.WithRecursive("subordinates", anchor, recursive, {"id", "name"}, RecursionGuard{10, "cte_depth", RecursionGuard::Policy::Truncate}).Query(main);
        if (auto sql = cte.ToSql()) {
            qDebug().noquote() << "SQL:" << QString::fromStdString(sql->sql);
        }
        if (auto rows = cte.All()) {
            printRows(*rows);
        } else {
            qCritical() << "CTE failed:" << errorText(rows.error());
        }
    }

    boost::asio::awaitable<void> runAsyncDemo(AsyncStorageBackend& backend) {
        if (auto connected = co_await backend.connectAsync(); !connected) {
            qCritical() << "Async connect failed:" << errorText(connected.error());
            co_return;
        }
        auto created = co_await backend.executeAsync(CompiledStatement{"CREATE TABLE events (id INTEGER PRIMARY KEY, payload TEXT)", {}});
        if (!created) {
            qCritical() << "Async DDL failed:" << errorText(created.error());
            co_return;
        }
        InsertQuery insert(&backend, "events");
        insert.Set("payload", lit("started"));
        if (auto res = co_await insert.ExecuteAsync()) {
            qDebug() << "Async insert id:" << res->last_insert_id.value_or(-1);
        }
        ActiveQuery events(&backend, "events");
        if (auto count = co_await events.CountAsync()) {
            qDebug() << "Async event count:" << *count;
        }
        if (auto closed = co_await backend.disconnectAsync(); !closed) {
            qWarning() << "Async disconnect failed:" << errorText(closed.error());
        }
    }

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    auto drivers = cppquery_sqldriver::SqlDriverRegistry::createWithBuiltinDrivers();
    if (!drivers) {
        std::cerr << "Driver registry initialization failed" << std::endl;
        return 1;
    }
    auto type_registry = TypeMappingRegistry::createWithBuiltins();

    auto config = BackendConfig::fromUri(argc > 1 ? argv[1] : "sqlite://:memory:");
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().toString() << std::endl;
        return 1;
    }
    config->log_level = spdlog::level::debug;

    auto backend = StorageBackend::create(*config, type_registry, *drivers);
    if (!backend) {
        std::cerr << "Backend creation failed: " << backend.error().toString() << std::endl;
        return 1;
    }
    if (auto connected = (*backend)->connect(); !connected) {
        std::cerr << "Connect failed: " << connected.error().toString() << std::endl;
        return 1;
    }

    if (createSchema(**backend)) {
        runUserQueries(**backend);
        runHierarchyQuery(**backend);
    }
    if (auto closed = (*backend)->disconnect(); !closed) {
        qWarning() << "Disconnect failed:" << errorText(closed.error());
    }

    qDebug() << "\n--- Async backend ---";
    BackendConfig async_config;
    auto async_backend = AsyncStorageBackend::create(async_config, type_registry, *drivers);
    if (!async_backend) {
        std::cerr << "Async backend creation failed: " << async_backend.error().toString() << std::endl;
        return 1;
    }
    boost::asio::io_context io;
    boost::asio::co_spawn(io, runAsyncDemo(**async_backend), boost::asio::detached);
    io.run();

    return 0;
}
