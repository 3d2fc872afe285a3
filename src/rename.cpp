#include "rename.hpp"

#include <cstddef>
#include <utility>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "validate.hpp"

namespace nflz
{

std::error_code RenameFile(const fs::path &old_path, const fs::path &new_path)
{
    std::error_code ec;
    fs::rename(old_path, new_path, ec);
    return ec;
}

std::vector<RenamePlanEntry> ApplyPlan(RenamePlan plan, const fs::path &directory)
{
    std::size_t renamed_count = 0;
    for (const auto &entry : plan.entries())
    {
        if (!entry.NeedsRename())
        {
            continue;
        }

        fs::path old_path = directory / entry.file().original_filename();
        fs::path new_path = directory / *entry.new_filename();

        std::error_code ec = RenameFile(old_path, new_path);
        if (ec)
        {
            spdlog::error("重命名失败：'{}' -> '{}'：{}", old_path.string(), new_path.string(), ec.message());
            throw RenameFailedError(std::move(old_path), std::move(new_path), ec, renamed_count);
        }

        spdlog::info("已重命名：{} -> {}", entry.file().original_filename(), *entry.new_filename());
        ++renamed_count;
    }

    return plan.TakeEntries();
}

std::vector<RenamePlanEntry> ExecutePlan(RenamePlan plan, const fs::path &directory)
{
    // 任何检查失败都不会改动目录
    ValidatePlan(plan, directory);
    return ApplyPlan(std::move(plan), directory);
}

} // namespace nflz
