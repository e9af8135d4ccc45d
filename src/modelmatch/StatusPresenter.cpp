// SPDX-License-Identifier: Apache-2.0
#include <modelmatch/StatusPresenter.hpp>

namespace modelmatch
{

auto hintFor(Mode mode) noexcept -> std::string_view
{
    switch (mode)
    {
        case Mode::Normal: return "Press <s> to search, <f> for folders, <m> for models, <t> for tenants";
        case Mode::Search: return "Press <Enter> to search, <Esc> to return to Normal mode";
        case Mode::Folder: return "Press <Enter> to list the folder's models, <Esc> to return to Normal mode";
        case Mode::Model: return "Press <Enter> to pick a model, <Esc> to return to Normal mode";
        case Mode::Match: return "Press <Esc> to return to Normal mode";
        case Mode::Help: return "Press any key to close the help";
        case Mode::Tenant: return "Press <Enter> to open a session, <Esc> to cancel";
    }
    return genericHint();
}

auto genericHint() noexcept -> std::string_view
{
    return "Press <h> for help or <q> to exit";
}

} // namespace modelmatch
