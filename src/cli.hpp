#pragma once

#include <functional>
#include <ostream>

#include "assistant.hpp"
#include "options.hpp"

namespace nflz
{

// 向用户确认计划，返回 true 表示继续重命名
using ConfirmFunction = std::function<bool(const Assistant &)>;

// 退出码
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1; // 致命错误，包括检查失败和重命名失败
constexpr int kExitUsage = 2;   // 命令行参数有误

// 扫描、展示计划、检查、确认并执行。
// 致命错误以异常抛出，由 RunCli 转换成退出码。
int Run(const Options &options, const ConfirmFunction &confirm, std::ostream &out);

// 完整的命令行流程：解析参数、设置日志、调用 Run，并把异常转换成退出码
int RunCli(int argc, const char *const argv[], const ConfirmFunction &confirm, std::ostream &out,
           std::ostream &err);

} // namespace nflz
