#include "PromptTemplate.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

#include "Errors.hpp"

namespace flowgraph {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

const json::value* lookup(const json::object& vars, std::string_view path) {
    const json::object* scope = &vars;
    const json::value* found = nullptr;

    while (true) {
        auto dot = path.find('.');
        auto head = path.substr(0, dot);

        auto it = scope->find(head);
        if (it == scope->end()) return nullptr;
        found = &it->value();

        if (dot == std::string_view::npos) return found;
        if (!found->is_object()) return nullptr;
        scope = &found->get_object();
        path.remove_prefix(dot + 1);
    }
}

}  // namespace

PromptTemplate::PromptTemplate(std::string text) : text_(std::move(text)) {
    std::string_view rest = text_;

    while (!rest.empty()) {
        auto open = rest.find("{{");
        if (open == std::string_view::npos) {
            segments_.push_back({false, std::string(rest)});
            break;
        }
        if (open > 0) segments_.push_back({false, std::string(rest.substr(0, open))});

        auto close = rest.find("}}", open + 2);
        if (close == std::string_view::npos) {
            throw ValidationError("unterminated placeholder in prompt template");
        }

        auto name = trim(rest.substr(open + 2, close - open - 2));
        if (!name.empty() && name.front() == '.') name.remove_prefix(1);
        if (name.empty()) {
            throw ValidationError("empty placeholder in prompt template");
        }
        segments_.push_back({true, std::string(name)});
        rest.remove_prefix(close + 2);
    }
}

std::string PromptTemplate::Render(const json::object& vars) const {
    std::string out;
    out.reserve(text_.size());

    for (const auto& segment : segments_) {
        if (!segment.is_placeholder) {
            out += segment.text;
            continue;
        }
        const json::value* value = lookup(vars, segment.text);
        if (value == nullptr) {
            throw NotFoundError("template variable not found in state: " + segment.text);
        }
        if (value->is_string()) {
            out.append(value->get_string().data(), value->get_string().size());
        } else {
            out += json::serialize(*value);
        }
    }
    return out;
}

std::vector<std::string> PromptTemplate::Variables() const {
    std::vector<std::string> names;
    for (const auto& segment : segments_) {
        if (segment.is_placeholder &&
            std::find(names.begin(), names.end(), segment.text) == names.end()) {
            names.push_back(segment.text);
        }
    }
    return names;
}

}  // namespace flowgraph
