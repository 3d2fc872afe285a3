#include "scan.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace nflz
{

std::vector<fs::path> ListRegularFiles(const fs::path &directory)
{
    std::vector<fs::path> files;
    std::error_code ec;

    // 遍历目录中的文件
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        // 指向普通文件的符号链接也算普通文件，无效链接会被忽略
        std::error_code type_ec;
        if (it->is_regular_file(type_ec))
        {
            files.push_back(it->path());
        }
        else if (type_ec)
        {
            spdlog::debug("忽略 '{}'：{}", it->path().string(), type_ec.message());
        }
    }
    if (ec)
    {
        throw DirectoryUnreadableError(directory, ec);
    }

    std::sort(files.begin(), files.end());
    return files;
}

ScanResult PartitionFiles(const std::vector<fs::path> &paths)
{
    FilenameParser parser;
    ScanResult result;

    for (const auto &path : paths)
    {
        ParseResult parsed = parser.Parse(path);
        if (auto *error = std::get_if<ParseError>(&parsed))
        {
            spdlog::info("跳过文件 '{}'：{}", error->filename, error->Message());
            result.skipped.push_back({path, std::move(*error)});
        }
        else
        {
            result.valid.push_back(std::get<ParsedFile>(std::move(parsed)));
        }
    }

    std::sort(result.valid.begin(), result.valid.end());
    return result;
}

ScanResult ScanDirectory(const fs::path &directory)
{
    ScanResult result = PartitionFiles(ListRegularFiles(directory));
    spdlog::debug("目录 '{}'：{} 个文件符合格式，{} 个被跳过", directory.string(), result.valid.size(),
                  result.skipped.size());
    return result;
}

} // namespace nflz
