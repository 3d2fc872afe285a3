#pragma once

#include "options.hpp"

namespace nflz
{

// 设置默认 logger：stderr 彩色输出，--log-file 时额外写入文件。
// 日志文件无法打开时抛出 spdlog::spdlog_ex。
void SetupLogging(const Options &options);

} // namespace nflz
