#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace flowgraph {

/**
 * @brief Prompt template with {{placeholder}} substitution.
 *
 * @details
 * A placeholder is "{{ name }}" with optional surrounding whitespace and an
 * optional leading dot ("{{.destination}}"). Dotted names walk nested
 * objects: "{{trip.budget}}" reads vars["trip"]["budget"].
 *
 * Strings render verbatim, every other JSON value renders as serialized
 * JSON. A placeholder that resolves to nothing is a hard failure.
 */
class PromptTemplate {
public:
    // @throws ValidationError on an unterminated or empty placeholder.
    explicit PromptTemplate(std::string text);

    // @throws NotFoundError naming the first unresolved placeholder.
    std::string Render(const json::object& vars) const;

    const std::string& text() const noexcept { return text_; }

    // Distinct placeholder names in order of first appearance.
    std::vector<std::string> Variables() const;

private:
    struct Segment {
        bool is_placeholder;
        std::string text;  // literal text, or the placeholder path
    };

    std::string text_;
    std::vector<Segment> segments_;
};

}  // namespace flowgraph
