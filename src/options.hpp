#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace nflz
{

namespace fs = std::filesystem;

// 命令行参数
struct Options
{
    fs::path directory = ".";
    bool assume_yes = false; // 不显示确认界面
    bool dry_run = false;    // 只显示计划
    bool verbose = false;
    std::string log_file;    // 为空时只输出到终端
    bool show_help = false;
    bool show_version = false;
};

class UsageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// 参数有误时抛出 UsageError
Options ParseOptions(int argc, const char *const argv[]);

std::string HelpText(const std::string &program);

} // namespace nflz
