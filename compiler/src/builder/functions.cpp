#include "builder/functions.hpp"

#include <cctype>

namespace stencil::builder {

auto split_label_text(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> labels;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            labels.emplace_back(text.substr(start, pos - start));
        }
    }
    return labels;
}

auto builtin_function_names() -> const std::vector<std::string>& {
    static const std::vector<std::string> names = {"if", "label", "separate"};
    return names;
}

} // namespace stencil::builder
