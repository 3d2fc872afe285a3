#pragma once

#include <filesystem>
#include <vector>

#include "error.hpp"
#include "parse.hpp"

namespace nflz
{

namespace fs = std::filesystem;

// 不符合格式而被跳过的文件
struct SkippedFile
{
    fs::path path;
    ParseError reason;
};

struct ScanResult
{
    std::vector<ParsedFile> valid;
    std::vector<SkippedFile> skipped;
};

// 目录中（不递归）所有普通文件的路径，按路径排序。
// 目录无法读取时抛出 DirectoryUnreadableError。
std::vector<fs::path> ListRegularFiles(const fs::path &directory);

// 把文件分成可以处理的和需要跳过的两部分，不访问文件系统
ScanResult PartitionFiles(const std::vector<fs::path> &paths);

ScanResult ScanDirectory(const fs::path &directory);

} // namespace nflz
