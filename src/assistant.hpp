#pragma once

#include <filesystem>
#include <vector>

#include "plan.hpp"
#include "scan.hpp"

namespace nflz
{

namespace fs = std::filesystem;

// 一个目录的完整流程：构造时扫描目录并计算计划，
// 调用方展示计划、调用 CheckCanRenameAll、向用户确认，最后调用 RenameAll。
class Assistant
{
public:
    // 目录无法读取时抛出 DirectoryUnreadableError
    explicit Assistant(fs::path directory);

    const fs::path &directory() const { return directory_; }
    const RenamePlan &plan() const { return plan_; }
    const std::vector<SkippedFile> &skipped() const { return skipped_; }

    std::vector<const RenamePlanEntry *> FilesToRename() const { return plan_.EntriesToRename(); }
    std::vector<const RenamePlanEntry *> FilesWithoutRename() const { return plan_.EntriesUnchanged(); }

    // 没有找到任何符合格式的文件，或者所有文件都已经是正确的名字
    bool NothingToDo() const { return plan_.RenameCount() == 0; }

    void CheckCanRenameAll() const;

    // 只能调用一次，计划会被消耗
    std::vector<RenamePlanEntry> RenameAll();

private:
    fs::path directory_;
    RenamePlan plan_;
    std::vector<SkippedFile> skipped_;
    bool executed_ = false;
};

} // namespace nflz
