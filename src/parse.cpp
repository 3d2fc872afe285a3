#include "parse.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace nflz
{

ParsedFile::ParsedFile(fs::path path, std::string original_filename, NumberGroupSpan span,
                       std::uint64_t number_value)
    : path_(std::move(path)),
      original_filename_(std::move(original_filename)),
      span_(span),
      number_value_(number_value)
{
}

std::string ParsedFile::prefix() const
{
    return original_filename_.substr(0, span_.begin);
}

std::string ParsedFile::suffix() const
{
    return original_filename_.substr(span_.end);
}

std::string ParsedFile::digits() const
{
    return original_filename_.substr(span_.begin, span_.end - span_.begin);
}

bool ParsedFile::operator<(const ParsedFile &other) const
{
    if (number_value_ != other.number_value_)
    {
        return number_value_ < other.number_value_;
    }
    return original_filename_ < other.original_filename_;
}

bool ParsedFile::operator==(const ParsedFile &other) const
{
    return original_filename_ == other.original_filename_;
}

FilenameParser::FilenameParser()
    : pattern_(R"(\(([0-9]+)\))")
{
}

ParseResult FilenameParser::Parse(const fs::path &path) const
{
    std::string filename = path.filename().string();

    // 收集所有不重叠的 "(数字)"
    std::vector<NumberGroupSpan> spans;
    for (auto it = std::sregex_iterator(filename.begin(), filename.end(), pattern_); it != std::sregex_iterator();
         ++it)
    {
        const std::smatch &match = *it;
        auto begin = static_cast<std::size_t>(match.position(1));
        spans.push_back({begin, begin + static_cast<std::size_t>(match.length(1))});
    }

    if (spans.empty())
    {
        return ParseError{ParseErrorKind::NoNumberGroup, filename, ""};
    }
    // 有多个数字组时无法确定哪个是序号，整个文件名都不处理
    if (spans.size() > 1)
    {
        return ParseError{ParseErrorKind::MultipleNumberGroups, filename, ""};
    }

    NumberGroupSpan span = spans.front();
    std::string digits = filename.substr(span.begin, span.end - span.begin);
    std::uint64_t value = 0;
    try
    {
        value = std::stoull(digits);
    }
    catch (const std::out_of_range &)
    {
        return ParseError{ParseErrorKind::InvalidNumber, filename, digits};
    }

    return ParsedFile(path, std::move(filename), span, value);
}

} // namespace nflz
