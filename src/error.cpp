#include "error.hpp"

#include <utility>

#include <fmt/core.h>

namespace nflz
{

namespace
{

// 'a', 'b', 'c'
std::string joinQuoted(const std::set<std::string> &values)
{
    std::string joined;
    for (const auto &value : values)
    {
        if (!joined.empty())
        {
            joined += ", ";
        }
        joined += "'" + value + "'";
    }
    return joined;
}

} // namespace

std::string ParseError::Message() const
{
    switch (kind)
    {
    case ParseErrorKind::NoNumberGroup:
        return fmt::format("文件名 '{}' 中没有括号包围的数字组", filename);
    case ParseErrorKind::MultipleNumberGroups:
        return fmt::format("文件名 '{}' 中有多个括号包围的数字组", filename);
    case ParseErrorKind::InvalidNumber:
        return fmt::format("文件名 '{}' 的数字组 '{}' 超出可表示的范围", filename, text);
    }
    return fmt::format("文件名 '{}' 无法解析", filename);
}

DirectoryUnreadableError::DirectoryUnreadableError(fs::path path, std::error_code cause)
    : Error(fmt::format("无法读取目录 '{}'：{}", path.string(), cause.message())),
      path_(std::move(path)),
      cause_(cause)
{
}

ConflictingFilesError::ConflictingFilesError(std::vector<fs::path> paths)
    : Error(fmt::format("无法重命名：{} 个新文件名与已有文件冲突", paths.size())),
      paths_(std::move(paths))
{
}

AmbiguousPrefixesError::AmbiguousPrefixesError(std::set<std::string> prefixes)
    : Error(fmt::format("目录中存在多个（有歧义的）前缀：{}", joinQuoted(prefixes))),
      prefixes_(std::move(prefixes))
{
}

AmbiguousSuffixesError::AmbiguousSuffixesError(std::set<std::string> suffixes)
    : Error(fmt::format("目录中存在多个（有歧义的）后缀：{}", joinQuoted(suffixes))),
      suffixes_(std::move(suffixes))
{
}

RenameFailedError::RenameFailedError(fs::path old_path, fs::path new_path, std::error_code cause,
                                     std::size_t renamed_count)
    : Error(fmt::format("无法将 '{}' 重命名为 '{}'：{}。之前已完成 {} 个重命名且不会回滚，目录现在可能处于不一致的状态",
                        old_path.string(), new_path.string(), cause.message(), renamed_count)),
      old_path_(std::move(old_path)),
      new_path_(std::move(new_path)),
      cause_(cause),
      renamed_count_(renamed_count)
{
}

} // namespace nflz
