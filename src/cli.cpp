#include "cli.hpp"

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include "error.hpp"
#include "logging.hpp"

namespace nflz
{

namespace
{

void PrintPlan(const Assistant &assistant, std::ostream &out)
{
    auto to_rename = assistant.FilesToRename();
    auto unchanged = assistant.FilesWithoutRename();

    out << "目录: " << assistant.directory().string() << "\n";
    out << "数字统一补齐到 " << assistant.plan().max_digit_width() << " 位\n\n";

    out << "将重命名 " << to_rename.size() << " 个文件:\n";
    for (const auto *entry : to_rename)
    {
        out << "  " << entry->file().original_filename() << " -> " << *entry->new_filename() << "\n";
    }

    if (!unchanged.empty())
    {
        out << "\n无需重命名 " << unchanged.size() << " 个文件:\n";
        for (const auto *entry : unchanged)
        {
            out << "  " << entry->file().original_filename() << "\n";
        }
    }
    out << std::endl;
}

} // namespace

int Run(const Options &options, const ConfirmFunction &confirm, std::ostream &out)
{
    Assistant assistant(options.directory);

    if (assistant.plan().empty())
    {
        out << "目录中没有 `名字 (数字).后缀` 格式的文件，无需操作。" << std::endl;
        return kExitOk;
    }
    if (assistant.NothingToDo())
    {
        out << "所有 " << assistant.plan().entries().size() << " 个文件都已经是正确的名字，无需操作。" << std::endl;
        return kExitOk;
    }

    PrintPlan(assistant, out);

    // 在任何修改之前检查
    assistant.CheckCanRenameAll();

    if (options.dry_run)
    {
        out << "检查通过（--dry-run，未做任何修改）。" << std::endl;
        return kExitOk;
    }
    if (!options.assume_yes && !confirm(assistant))
    {
        out << "已取消，未做任何修改。" << std::endl;
        return kExitOk;
    }

    std::size_t renamed = assistant.plan().RenameCount();
    std::size_t total = assistant.plan().entries().size();
    std::vector<RenamePlanEntry> entries = assistant.RenameAll();

    out << "成功：已重命名 " << renamed << " 个文件，" << total - renamed << " 个文件无需重命名（共 " << entries.size()
        << " 个）。" << std::endl;
    return kExitOk;
}

int RunCli(int argc, const char *const argv[], const ConfirmFunction &confirm, std::ostream &out,
           std::ostream &err)
{
    std::string program = argc > 0 ? argv[0] : "nflz";

    Options options;
    try
    {
        options = ParseOptions(argc, argv);
    }
    catch (const UsageError &e)
    {
        err << "错误：" << e.what() << "\n\n" << HelpText(program);
        return kExitUsage;
    }

    if (options.show_help)
    {
        out << HelpText(program);
        return kExitOk;
    }
    if (options.show_version)
    {
        out << "nflz " << NFLZ_VERSION << std::endl;
        return kExitOk;
    }

    try
    {
        SetupLogging(options);
        return Run(options, confirm, out);
    }
    catch (const ConflictingFilesError &e)
    {
        err << "错误：" << e.what() << "\n";
        for (const auto &path : e.paths())
        {
            err << "  • " << path.string() << "\n";
        }
    }
    catch (const RenameFailedError &e)
    {
        err << "失败：" << e.what() << std::endl;
    }
    catch (const Error &e)
    {
        err << "错误：" << e.what() << std::endl;
    }
    catch (const std::exception &e)
    {
        err << "错误：" << e.what() << std::endl;
    }
    return kExitFailure;
}

} // namespace nflz
