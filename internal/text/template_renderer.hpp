#pragma once

#include <string>
#include <string_view>

namespace adrgen::text {

// Values substituted for {{number}}, {{status}}, {{title}} and {{date}}.
struct TemplateValues {
  std::string number;
  std::string status;
  std::string title;
  std::string date;
};

/*
  Single left-to-right pass over the template.

  Each known placeholder is replaced by its value; the value itself is
  never rescanned. Unknown {{tokens}} and stray braces are copied through.
*/
std::string Render(std::string_view tmpl, const TemplateValues& values);

// Built-in record template used when the store has no template override.
const std::string& DefaultTemplate();

} // namespace adrgen::text
