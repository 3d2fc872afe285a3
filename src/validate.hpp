#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "plan.hpp"

namespace nflz
{

namespace fs = std::filesystem;

// 在任何重命名之前检查计划，失败时抛出：
//  - AmbiguousPrefixesError / AmbiguousSuffixesError：文件不属于同一个序列
//  - ConflictingFilesError：新文件名已经存在，或者两个文件会得到同一个新文件名
void ValidatePlan(const RenamePlan &plan, const fs::path &directory);

// 所有文件（包括无需重命名的）必须有相同的前缀和后缀。
// 唯一的例外是恰好两个只有大小写不同的后缀，例如 ").jpg" 和 ").JPG"。
void CheckSamePrefixAndSuffix(const RenamePlan &plan);

// 返回所有冲突的目标路径，没有冲突时为空
std::vector<fs::path> FindConflictingFiles(const RenamePlan &plan, const fs::path &directory);

// 只比较 ASCII 字母的大小写
bool EqualsIgnoreCase(const std::string &lhs, const std::string &rhs);

} // namespace nflz
