#ifndef cppquery_QUERY_SOURCE_H
#define cppquery_QUERY_SOURCE_H

#include <cstddef>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cppquery/error.h"

namespace cppquery {

    class RenderContext;

    // 可以作为子查询 / 集合运算操作数 / CTE 定义被嵌入的查询.
    // 实现必须是只读快照: 渲染不会修改它
    class QuerySource {
      public:
        virtual ~QuerySource() = default;

        // 把完整的 SELECT 语句渲染进 ctx, 参数按出现顺序追加
        virtual std::expected<std::string, Error> renderInto(RenderContext& ctx) const = 0;

        // 能从 SELECT 列表静态确定时返回投影列数
        virtual std::optional<std::size_t> projectedColumnCount() const = 0;
        // 结果列名 (别名优先), 无法确定的位置为空字符串
        virtual std::vector<std::string> projectedColumnNames() const = 0;
        // 是否带有 ORDER BY / LIMIT / OFFSET / WITH 等不能直接出现在复合查询操作数中的部分
        virtual bool hasTrailingClauses() const = 0;
        // 引用到的、且不由自身 WITH 子句定义的 CTE 名称
        virtual void collectCteReferences(std::set<std::string>& names) const = 0;
    };

}  // namespace cppquery

#endif  // cppquery_QUERY_SOURCE_H
