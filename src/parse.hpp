#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <regex>
#include <string>
#include <variant>

#include "error.hpp"

namespace nflz
{

namespace fs = std::filesystem;

// 数字组在文件名中的位置，不包括括号，[begin, end)
struct NumberGroupSpan
{
    std::size_t begin;
    std::size_t end;
};

// 一个符合 `<前缀>(<数字>)<后缀>` 格式的文件。构造后不可修改。
class ParsedFile
{
public:
    ParsedFile(fs::path path, std::string original_filename, NumberGroupSpan span, std::uint64_t number_value);

    const fs::path &path() const { return path_; }
    const std::string &original_filename() const { return original_filename_; }
    NumberGroupSpan number_group_span() const { return span_; }
    std::uint64_t number_value() const { return number_value_; }

    // 数字组之前的部分，包括 "("，例如 "paris ("
    std::string prefix() const;
    // 数字组之后的部分，包括 ")"，例如 ").jpg"
    std::string suffix() const;
    // 原始的数字串，可能带有前导零，例如 "007"
    std::string digits() const;

    // 按数字排序，数字相同时按文件名排序
    bool operator<(const ParsedFile &other) const;
    // 文件名相同即视为同一个文件
    bool operator==(const ParsedFile &other) const;
    bool operator!=(const ParsedFile &other) const { return !(*this == other); }

private:
    fs::path path_;
    std::string original_filename_;
    NumberGroupSpan span_;
    std::uint64_t number_value_;
};

using ParseResult = std::variant<ParsedFile, ParseError>;

// 查找文件名中用括号包围的数字组。正则只在构造时编译一次。
class FilenameParser
{
public:
    FilenameParser();

    // 只看路径的最后一部分（文件名）
    ParseResult Parse(const fs::path &path) const;

private:
    std::regex pattern_;
};

} // namespace nflz
