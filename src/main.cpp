#include <cstddef>
#include <iostream>
#include <string>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include "assistant.hpp"
#include "cli.hpp"

using namespace ftxui;

namespace
{

// 确认界面中最多列出的文件数
constexpr std::size_t kMaxListedFiles = 15;

// 显示确认界面，用户选择重命名时返回 true
bool ConfirmRename(const nflz::Assistant &assistant)
{
    bool confirmed = false;
    auto screen = ScreenInteractive::TerminalOutput();

    auto to_rename = assistant.FilesToRename();
    auto unchanged = assistant.FilesWithoutRename();

    // 定义按钮组件
    Component rename_button = Button("重命名", [&]
                                     {
        confirmed = true;
        screen.Exit(); });
    Component cancel_button = Button("取消", [&]
                                     { screen.Exit(); });

    auto layout = Container::Horizontal({
        rename_button,
        cancel_button,
    });

    // 渲染界面
    auto renderer = Renderer(layout, [&]
                             {
        Elements display_elements;
        display_elements.push_back(hbox(text(" 目录:  "), text(assistant.directory().string()) | bold));
        display_elements.push_back(hbox(text(" 位数:  "), text(std::to_string(assistant.plan().max_digit_width()))));
        display_elements.push_back(separator());

        // 重命名列表
        display_elements.push_back(text(" 将重命名 " + std::to_string(to_rename.size()) + " 个文件:"));
        for (std::size_t i = 0; i < to_rename.size() && i < kMaxListedFiles; ++i)
        {
            display_elements.push_back(hbox({
                text("   " + to_rename[i]->file().original_filename()),
                text(" -> "),
                text(*to_rename[i]->new_filename()) | color(Color::Green),
            }));
        }
        if (to_rename.size() > kMaxListedFiles)
        {
            display_elements.push_back(text("   ... 还有 " + std::to_string(to_rename.size() - kMaxListedFiles) + " 个文件") | dim);
        }

        if (!unchanged.empty())
        {
            display_elements.push_back(text(" 无需重命名: " + std::to_string(unchanged.size()) + " 个文件") | dim);
        }
        display_elements.push_back(separator());

        // 重命名无法撤销
        display_elements.push_back(text(" 已完成的重命名不会自动撤销，请确认后继续。") | color(Color::Yellow));
        display_elements.push_back(separator());

        // 按钮布局
        auto buttons = hbox({
            rename_button->Render() | border | color(Color::Green),
            text(" "),
            cancel_button->Render() | border | color(Color::Red),
        }) | center;

        display_elements.push_back(buttons);

        return vbox(display_elements) | border; });

    screen.Loop(renderer);
    return confirmed;
}

} // namespace

int main(int argc, char *argv[])
{
    return nflz::RunCli(argc, argv, ConfirmRename, std::cout, std::cerr);
}
