#include <t9s/kinds/KindSpec.hpp>

#include <algorithm>

namespace T9 {

auto DetailSpec::tabIndex(std::optional<std::string> const& slug) const -> std::size_t {
    if (!slug) {
        return 0;
    }
    for (std::size_t i = 0; i < tabs.size(); ++i) {
        if (tabs[i].slug == *slug) {
            return i;
        }
        if (std::find(tabs[i].aliases.begin(), tabs[i].aliases.end(), *slug) != tabs[i].aliases.end()) {
            return i;
        }
    }
    return 0;
}

auto KindSpec::acceptsSegment(std::string_view token) const -> bool {
    if (token == segment) {
        return true;
    }
    return std::find(aliases.begin(), aliases.end(), token) != aliases.end();
}

auto KindSpec::findOperation(OperationId op) const -> OperationSpec const* {
    for (auto const& operation : operations) {
        if (operation.id == op) {
            return &operation;
        }
    }
    return nullptr;
}

auto KindSpec::allowsChild(KindId child) const -> bool {
    return std::find(children.begin(), children.end(), child) != children.end();
}

} // namespace T9
