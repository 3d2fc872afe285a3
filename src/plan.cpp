#include "plan.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "padding.hpp"

namespace nflz
{

RenamePlanEntry::RenamePlanEntry(ParsedFile file, std::optional<std::string> new_filename)
    : file_(std::move(file)),
      new_filename_(std::move(new_filename))
{
    if (new_filename_ && *new_filename_ == file_.original_filename())
    {
        throw std::invalid_argument("新文件名与原文件名相同：" + *new_filename_);
    }
}

RenamePlan::RenamePlan(std::vector<RenamePlanEntry> entries, std::size_t max_digit_width)
    : entries_(std::move(entries)),
      max_digit_width_(max_digit_width)
{
}

std::vector<const RenamePlanEntry *> RenamePlan::EntriesToRename() const
{
    std::vector<const RenamePlanEntry *> result;
    for (const auto &entry : entries_)
    {
        if (entry.NeedsRename())
        {
            result.push_back(&entry);
        }
    }
    return result;
}

std::vector<const RenamePlanEntry *> RenamePlan::EntriesUnchanged() const
{
    std::vector<const RenamePlanEntry *> result;
    for (const auto &entry : entries_)
    {
        if (!entry.NeedsRename())
        {
            result.push_back(&entry);
        }
    }
    return result;
}

std::size_t RenamePlan::RenameCount() const
{
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const auto &entry) { return entry.NeedsRename(); }));
}

std::vector<RenamePlanEntry> RenamePlan::TakeEntries()
{
    std::vector<RenamePlanEntry> entries = std::move(entries_);
    entries_.clear();
    max_digit_width_ = 0;
    return entries;
}

std::string PaddedFilename(const ParsedFile &file, std::size_t width)
{
    // 0 的位数是 0，所以这里不能直接用 setw(width)
    std::size_t zeroes = LeadingZeroCount(file.number_value(), width);

    std::ostringstream newFilenameStream;
    newFilenameStream << file.prefix() << std::string(zeroes, '0') << file.number_value() << file.suffix();
    return newFilenameStream.str();
}

RenamePlan BuildPlan(std::vector<ParsedFile> files)
{
    if (files.empty())
    {
        return RenamePlan();
    }

    // 按照数字部分排序
    std::sort(files.begin(), files.end());

    std::size_t max_digit_width = CountDigits(files.back().number_value());

    std::vector<RenamePlanEntry> entries;
    entries.reserve(files.size());
    for (auto &file : files)
    {
        std::string new_filename = PaddedFilename(file, max_digit_width);

        // 避免不必要的重命名
        if (new_filename == file.original_filename())
        {
            spdlog::debug("无需重命名：文件 '{}' 已经是正确的名字", file.original_filename());
            entries.emplace_back(std::move(file), std::nullopt);
        }
        else
        {
            entries.emplace_back(std::move(file), std::move(new_filename));
        }
    }

    return RenamePlan(std::move(entries), max_digit_width);
}

} // namespace nflz
