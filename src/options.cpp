#include "options.hpp"

namespace nflz
{

Options ParseOptions(int argc, const char *const argv[])
{
    Options options;
    bool directory_given = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
        }
        else if (arg == "--version")
        {
            options.show_version = true;
        }
        else if (arg == "-y" || arg == "--yes")
        {
            options.assume_yes = true;
        }
        else if (arg == "-n" || arg == "--dry-run")
        {
            options.dry_run = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--log-file")
        {
            if (i + 1 >= argc)
            {
                throw UsageError("选项 --log-file 需要一个文件路径");
            }
            options.log_file = argv[++i];
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            throw UsageError("未知选项：" + arg);
        }
        else
        {
            if (directory_given)
            {
                throw UsageError("只能指定一个目录：" + arg);
            }
            options.directory = arg;
            directory_given = true;
        }
    }

    return options;
}

std::string HelpText(const std::string &program)
{
    return "用法: " + program + " [选项] [目录]\n"
           "\n"
           "为目录中 `名字 (数字).后缀` 格式的文件补齐前导零，\n"
           "例如 `paris (1).jpg` => `paris (001).jpg`，使按字母排序与按数字排序一致。\n"
           "目录默认为当前目录。\n"
           "\n"
           "选项:\n"
           "  -y, --yes          不确认，直接重命名\n"
           "  -n, --dry-run      只显示重命名计划，不做任何修改\n"
           "  -v, --verbose      输出调试日志\n"
           "      --log-file F   同时把日志写入文件 F\n"
           "  -h, --help         显示此帮助\n"
           "      --version      显示版本\n";
}

} // namespace nflz
