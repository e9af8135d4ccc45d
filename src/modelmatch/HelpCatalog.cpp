// SPDX-License-Identifier: Apache-2.0
#include <modelmatch/HelpCatalog.hpp>

namespace modelmatch
{

namespace
{
    constexpr auto NormalHelp = std::string_view {
        "<q>           Exit the program\n"
        "<s>           Switch to Search mode\n"
        "<f> or <Tab>  Switch to Folder mode\n"
        "<m>           Switch to Model mode\n"
        "<c>           Switch to Match mode\n"
        "<t>           Select a tenant\n"
        "<h> or <F1>   Show this help\n"
        "\n"
        "Press any key to close this help."
    };

    constexpr auto SearchHelp = std::string_view {
        "<Esc>           Exit to Normal mode\n"
        "<Enter>         Execute search\n"
        "<Backspace>     Delete the previous character\n"
        "<Delete>        Delete the character under the cursor\n"
        "<Left> <Right>  Move the cursor\n"
        "<Home> <End>    Jump to the start or end of the text\n"
        "<Alt+h> <F1>    Show this help\n"
        "\n"
        "Press any key to close this help."
    };

    constexpr auto FolderHelp = std::string_view {
        "<Esc>         Exit to Normal mode\n"
        "<Up> <Down>   Select the previous or next folder\n"
        "<Home> <End>  Select the first or last folder\n"
        "<Enter>       List the models of the selected folder\n"
        "<r>           Reload the list of folders\n"
        "<Tab>         Switch to Model mode\n"
        "<h>           Show this help\n"
        "\n"
        "Press any key to close this help."
    };

    constexpr auto ModelHelp = std::string_view {
        "<Esc>         Exit to Normal mode\n"
        "<Up> <Down>   Select the previous or next model\n"
        "<Home> <End>  Select the first or last model\n"
        "<Enter>       Pick the selected model\n"
        "<Tab>         Switch to Folder mode\n"
        "<h>           Show this help\n"
        "\n"
        "Press any key to close this help."
    };

    constexpr auto MatchHelp = std::string_view {
        "<Esc>  Exit to Normal mode\n"
        "<h>    Show this help\n"
        "\n"
        "Press any key to close this help."
    };

    constexpr auto TenantHelp = std::string_view {
        "<Esc>         Close the tenant picker\n"
        "<Up> <Down>   Select the previous or next tenant\n"
        "<Home> <End>  Select the first or last tenant\n"
        "<Enter>       Open a session for the selected tenant\n"
        "<h>           Show this help\n"
        "\n"
        "Press any key to close this help."
    };
} // namespace

auto helpText(HelpTopic topic) noexcept -> std::string_view
{
    switch (topic)
    {
        case HelpTopic::Normal: return NormalHelp;
        case HelpTopic::Search: return SearchHelp;
        case HelpTopic::Folder: return FolderHelp;
        case HelpTopic::Model: return ModelHelp;
        case HelpTopic::Match: return MatchHelp;
        case HelpTopic::Tenant: return TenantHelp;
    }
    return NormalHelp;
}

} // namespace modelmatch
