#include "internal/text/template_renderer.hpp"

#include <array>
#include <utility>

namespace adrgen::text {
namespace {

constexpr std::string_view kNumberToken = "{{number}}";
constexpr std::string_view kStatusToken = "{{status}}";
constexpr std::string_view kTitleToken  = "{{title}}";
constexpr std::string_view kDateToken   = "{{date}}";

constexpr std::string_view kDefaultTemplate = R"(# ADR {{number}}: {{title}}

**Status**: {{status}}  
**Date**: {{date}}

---

## Context

Describe here the problem, need, or motivation for this decision. Include the current scenario, technical or business constraints, and the factors influencing the choice.

## Decision

Clearly state the decision made. For example:

> We decided to adopt the XYZ framework for developing REST APIs in the ABC project.

## Considered Alternatives

- **Alternative A** (chosen): reasons for the choice...
- **Alternative B**: reasons for not choosing...
- **Alternative C**: pros and cons...

## Consequences

Explain the impacts of this decision:

- Immediate or long-term benefits
- Possible risks or side effects
- Actions required to implement the decision

## Relations

- Replaces ADR: 'adr-XXX.md' _(if applicable)_
- Replaced by ADR: 'adr-XXX.md' _(if applicable)_
- Related to: issues, RFCs, previous decisions

---

_This ADR follows the model of [Joel Parker Henderson](https://github.com/joelparkerhenderson/architecture-decision-record)_
)";

} // namespace

std::string Render(std::string_view tmpl, const TemplateValues& values) {
  const std::array<std::pair<std::string_view, const std::string*>, 4> substitutions{{
      {kNumberToken, &values.number},
      {kStatusToken, &values.status},
      {kTitleToken, &values.title},
      {kDateToken, &values.date},
  }};

  std::string out;
  out.reserve(tmpl.size());

  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    const auto open = tmpl.find("{{", pos);
    if (open == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }

    out.append(tmpl.substr(pos, open - pos));

    const auto rest    = tmpl.substr(open);
    bool       matched = false;
    for (const auto& [token, value] : substitutions) {
      if (rest.compare(0, token.size(), token) == 0) {
        out.append(*value);
        pos     = open + token.size();
        matched = true;
        break;
      }
    }

    if (!matched) {
      // Emit one brace only so "{{{title}}" still finds the token at open + 1.
      out.push_back('{');
      pos = open + 1;
    }
  }

  return out;
}

const std::string& DefaultTemplate() {
  static const std::string kTemplate(kDefaultTemplate);
  return kTemplate;
}

} // namespace adrgen::text
