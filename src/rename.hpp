#pragma once

#include <filesystem>
#include <system_error>
#include <vector>

#include "plan.hpp"

namespace nflz
{

namespace fs = std::filesystem;

// 原子地把 old_path 重命名为 new_path，失败时返回系统错误
std::error_code RenameFile(const fs::path &old_path, const fs::path &new_path);

// 按计划顺序逐个重命名，不做检查，调用方负责先调用 ValidatePlan。
// 第一次失败时抛出 RenameFailedError，已经完成的重命名不会回滚。
// 成功时返回计划中的全部条目（包括无需重命名的）。
std::vector<RenamePlanEntry> ApplyPlan(RenamePlan plan, const fs::path &directory);

// ValidatePlan 之后 ApplyPlan
std::vector<RenamePlanEntry> ExecutePlan(RenamePlan plan, const fs::path &directory);

} // namespace nflz
