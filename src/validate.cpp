#include "validate.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "error.hpp"

namespace nflz
{

void ValidatePlan(const RenamePlan &plan, const fs::path &directory)
{
    CheckSamePrefixAndSuffix(plan);

    std::vector<fs::path> conflicts = FindConflictingFiles(plan, directory);
    if (!conflicts.empty())
    {
        for (const auto &path : conflicts)
        {
            spdlog::error("目标文件已存在或重复：{}", path.string());
        }
        throw ConflictingFilesError(std::move(conflicts));
    }
}

void CheckSamePrefixAndSuffix(const RenamePlan &plan)
{
    std::set<std::string> prefixes;
    std::set<std::string> suffixes;
    for (const auto &entry : plan.entries())
    {
        prefixes.insert(entry.file().prefix());
        suffixes.insert(entry.file().suffix());
    }

    // 前缀不允许任何差异，包括大小写
    if (prefixes.size() > 1)
    {
        throw AmbiguousPrefixesError(std::move(prefixes));
    }

    // 不同相机拍的照片合并后可能出现 .jpg 和 .JPG
    if (suffixes.size() == 2 && EqualsIgnoreCase(*suffixes.begin(), *suffixes.rbegin()))
    {
        return;
    }
    if (suffixes.size() > 1)
    {
        throw AmbiguousSuffixesError(std::move(suffixes));
    }
}

std::vector<fs::path> FindConflictingFiles(const RenamePlan &plan, const fs::path &directory)
{
    std::vector<fs::path> conflicts;
    std::set<std::string> planned_names;
    for (const auto &entry : plan.entries())
    {
        if (!entry.NeedsRename())
        {
            continue;
        }

        const std::string &new_filename = *entry.new_filename();
        fs::path target = directory / new_filename;

        // 两个文件（例如 "(1)" 和 "(01)"）得到同一个新文件名，rename 会覆盖前一个
        bool duplicate = !planned_names.insert(new_filename).second;

        // 无法确定目标是否存在（例如没有权限）时同样视为冲突
        std::error_code ec;
        fs::file_status status = fs::symlink_status(target, ec);
        if (!fs::status_known(status))
        {
            spdlog::warn("无法检查目标文件 '{}'：{}", target.string(), ec.message());
        }
        bool exists = fs::exists(status) || !fs::status_known(status);
        if (exists || duplicate)
        {
            if (std::find(conflicts.begin(), conflicts.end(), target) == conflicts.end())
            {
                conflicts.push_back(target);
            }
        }
    }
    return conflicts;
}

bool EqualsIgnoreCase(const std::string &lhs, const std::string &rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        auto a = static_cast<unsigned char>(lhs[i]);
        auto b = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(a) != std::tolower(b))
        {
            return false;
        }
    }
    return true;
}

} // namespace nflz
