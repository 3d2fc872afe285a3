#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "parse.hpp"

namespace nflz
{

// 一个文件以及它的新文件名。新文件名为空表示文件已经有正确的前导零。
class RenamePlanEntry
{
public:
    // new_filename 与原文件名相同时抛出 std::invalid_argument
    RenamePlanEntry(ParsedFile file, std::optional<std::string> new_filename);

    const ParsedFile &file() const { return file_; }
    const std::optional<std::string> &new_filename() const { return new_filename_; }

    bool NeedsRename() const { return new_filename_.has_value(); }

    bool operator<(const RenamePlanEntry &other) const { return file_ < other.file_; }
    bool operator==(const RenamePlanEntry &other) const { return file_ == other.file_; }
    bool operator!=(const RenamePlanEntry &other) const { return !(*this == other); }

private:
    ParsedFile file_;
    std::optional<std::string> new_filename_;
};

class RenamePlan
{
public:
    RenamePlan() = default;
    RenamePlan(std::vector<RenamePlanEntry> entries, std::size_t max_digit_width);

    const std::vector<RenamePlanEntry> &entries() const { return entries_; }
    std::size_t max_digit_width() const { return max_digit_width_; }
    bool empty() const { return entries_.empty(); }

    // 需要重命名的文件
    std::vector<const RenamePlanEntry *> EntriesToRename() const;
    // 已经是正确名字的文件
    std::vector<const RenamePlanEntry *> EntriesUnchanged() const;
    std::size_t RenameCount() const;

    // 取出所有条目，之后计划为空
    std::vector<RenamePlanEntry> TakeEntries();

private:
    std::vector<RenamePlanEntry> entries_;
    std::size_t max_digit_width_ = 0;
};

// 把数字补齐到 width 位后的文件名，例如 ("paris (1).jpg", 3) => "paris (001).jpg"
std::string PaddedFilename(const ParsedFile &file, std::size_t width);

// 根据最大数字的位数计算每个文件的新文件名，结果按数字升序排列
RenamePlan BuildPlan(std::vector<ParsedFile> files);

} // namespace nflz
