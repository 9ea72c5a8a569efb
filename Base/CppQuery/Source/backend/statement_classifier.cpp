// cppquery/Source/backend/statement_classifier.cpp
#include "cppquery/backend/statement_classifier.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace cppquery {

    namespace {

        // 在 SQL 文本上逐词前进, 跳过空白、注释与引号内文本
        class Scanner {
          public:
            explicit Scanner(std::string_view sql) : sql_(sql) {
            }

            bool atEnd() {
                skipTrivia();
                return pos_ >= sql_.size();
            }

            // 返回下一个 token: 关键字/标识符 (大写), 或单个符号字符. 引号文本返回空串
            std::string next() {
                skipTrivia();
                if (pos_ >= sql_.size()) return {};
                char c = sql_[pos_];
                if (c == '\'' || c == '"' || c == '`' || c == '[') {
                    skipQuoted(c == '[' ? ']' : c);
                    return {};
                }
                if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                    std::string word;
                    while (pos_ < sql_.size() && (std::isalnum(static_cast<unsigned char>(sql_[pos_])) || sql_[pos_] == '_')) {
                        word.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(sql_[pos_]))));
                        ++pos_;
                    }
                    return word;
                }
                ++pos_;
                return std::string(1, c);
            }

          private:
            void skipTrivia() {
                while (pos_ < sql_.size()) {
                    char c = sql_[pos_];
                    if (std::isspace(static_cast<unsigned char>(c))) {
                        ++pos_;
                    } else if (c == '-' && pos_ + 1 < sql_.size() && sql_[pos_ + 1] == '-') {
                        while (pos_ < sql_.size() && sql_[pos_] != '\n') ++pos_;
                    } else if (c == '/' && pos_ + 1 < sql_.size() && sql_[pos_ + 1] == '*') {
                        auto end = sql_.find("*/", pos_ + 2);
                        pos_ = (end == std::string_view::npos) ? sql_.size() : end + 2;
                    } else {
                        break;
                    }
                }
            }

            void skipQuoted(char close) {
                ++pos_;
                while (pos_ < sql_.size()) {
                    if (sql_[pos_] == close) {
                        // 连写两个引号表示转义
                        if (close != ']' && pos_ + 1 < sql_.size() && sql_[pos_ + 1] == close) {
                            pos_ += 2;
                            continue;
                        }
                        ++pos_;
                        return;
                    }
                    ++pos_;
                }
            }

            std::string_view sql_;
            std::size_t pos_ = 0;
        };

        StatementClassification classifyKeyword(const std::string& keyword) {
            StatementClassification result;
            if (keyword == "SELECT" || keyword == "VALUES") {
                result.kind = StatementKind::Select;
                result.returns_rows = true;
            } else if (keyword == "INSERT" || keyword == "REPLACE") {
                result.kind = StatementKind::Insert;
            } else if (keyword == "UPDATE") {
                result.kind = StatementKind::Update;
            } else if (keyword == "DELETE") {
                result.kind = StatementKind::Delete;
            } else if (keyword == "CREATE" || keyword == "DROP" || keyword == "ALTER" || keyword == "TRUNCATE" || keyword == "RENAME") {
                result.kind = StatementKind::DDL;
            } else if (keyword == "BEGIN" || keyword == "COMMIT" || keyword == "ROLLBACK" || keyword == "SAVEPOINT" || keyword == "RELEASE" || keyword == "END" || keyword == "START") {
                result.kind = StatementKind::TransactionControl;
            } else if (keyword == "PRAGMA" || keyword == "EXPLAIN" || keyword == "ANALYZE" || keyword == "SHOW" || keyword == "DESCRIBE") {
                result.kind = StatementKind::Other;
                result.returns_rows = true;
            }
            return result;
        }

        bool isDml(StatementKind kind) {
            return kind == StatementKind::Insert || kind == StatementKind::Update || kind == StatementKind::Delete;
        }

    }  // namespace

    StatementClassification StatementClassifier::classify(std::string_view sql) {
        Scanner scanner(sql);

        // 第一个关键字, 跳过前导括号 ("(SELECT ...) UNION ...")
        std::string token;
        while (!scanner.atEnd()) {
            token = scanner.next();
            if (token != "(") break;
        }
        if (token.empty() || !std::isalpha(static_cast<unsigned char>(token[0]))) {
            return {};
        }

        std::string main_keyword = token;
        int depth = 0;
        bool resolved = (token != "WITH");
        bool has_returning = false;

        // WITH 的主语句关键字是 CTE 列表之后深度 0 处出现的第一个语句关键字
        while (!scanner.atEnd()) {
            token = scanner.next();
            if (token == "(") {
                ++depth;
            } else if (token == ")") {
                depth = std::max(0, depth - 1);
            } else if (depth == 0 && !token.empty()) {
                if (!resolved && (token == "SELECT" || token == "VALUES" || token == "INSERT" || token == "REPLACE" || token == "UPDATE" || token == "DELETE")) {
                    main_keyword = token;
                    resolved = true;
                } else if (resolved && token == "RETURNING") {
                    has_returning = true;
                }
            }
        }

        if (!resolved) {
            return {};
        }
        StatementClassification result = classifyKeyword(main_keyword);
        if (isDml(result.kind) && has_returning) {
            result.has_returning = true;
            result.returns_rows = true;
        }
        return result;
    }

}  // namespace cppquery
