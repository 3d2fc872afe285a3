#include "assistant.hpp"

#include <stdexcept>
#include <utility>

#include "rename.hpp"
#include "validate.hpp"

namespace nflz
{

Assistant::Assistant(fs::path directory)
    : directory_(std::move(directory))
{
    ScanResult scan = ScanDirectory(directory_);
    skipped_ = std::move(scan.skipped);
    plan_ = BuildPlan(std::move(scan.valid));
}

void Assistant::CheckCanRenameAll() const
{
    ValidatePlan(plan_, directory_);
}

std::vector<RenamePlanEntry> Assistant::RenameAll()
{
    if (executed_)
    {
        throw std::logic_error("重命名计划已经执行过了");
    }
    // 检查失败时计划保持不变，可以再次调用
    CheckCanRenameAll();

    // 已经检查过，只执行重命名
    executed_ = true;
    RenamePlan plan = std::move(plan_);
    plan_ = RenamePlan();
    return ApplyPlan(std::move(plan), directory_);
}

} // namespace nflz
