#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace nflz
{

namespace fs = std::filesystem;

// 单个文件名无法使用的原因，这类文件只会被跳过
enum class ParseErrorKind
{
    NoNumberGroup,
    MultipleNumberGroups,
    InvalidNumber,
};

struct ParseError
{
    ParseErrorKind kind;
    std::string filename;
    std::string text; // 无法解析的数字串，仅 InvalidNumber 使用

    std::string Message() const;
};

// 所有致命错误的基类
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class DirectoryUnreadableError : public Error
{
public:
    DirectoryUnreadableError(fs::path path, std::error_code cause);

    const fs::path &path() const { return path_; }
    std::error_code cause() const { return cause_; }

private:
    fs::path path_;
    std::error_code cause_;
};

// 新文件名与已有文件（或计划中的另一个新文件名）冲突
class ConflictingFilesError : public Error
{
public:
    explicit ConflictingFilesError(std::vector<fs::path> paths);

    const std::vector<fs::path> &paths() const { return paths_; }

private:
    std::vector<fs::path> paths_;
};

class AmbiguousPrefixesError : public Error
{
public:
    explicit AmbiguousPrefixesError(std::set<std::string> prefixes);

    const std::set<std::string> &prefixes() const { return prefixes_; }

private:
    std::set<std::string> prefixes_;
};

class AmbiguousSuffixesError : public Error
{
public:
    explicit AmbiguousSuffixesError(std::set<std::string> suffixes);

    const std::set<std::string> &suffixes() const { return suffixes_; }

private:
    std::set<std::string> suffixes_;
};

// 重命名中途失败，之前已经完成的重命名不会回滚
class RenameFailedError : public Error
{
public:
    RenameFailedError(fs::path old_path, fs::path new_path, std::error_code cause, std::size_t renamed_count);

    const fs::path &old_path() const { return old_path_; }
    const fs::path &new_path() const { return new_path_; }
    std::error_code cause() const { return cause_; }
    std::size_t renamed_count() const { return renamed_count_; }

private:
    fs::path old_path_;
    fs::path new_path_;
    std::error_code cause_;
    std::size_t renamed_count_;
};

} // namespace nflz
