#include "veil_html_highlighter.h"
#include "veil_pattern_type.h"

namespace VeilRender {

std::string EscapeHtml(const std::string& text) {
  std::string result;
  result.reserve(text.length() * 1.2);  // Reserve extra space for escapes

  for (char ch : text) {
    switch (ch) {
      case '&':
        result += "&amp;";
        break;
      case '<':
        result += "&lt;";
        break;
      case '>':
        result += "&gt;";
        break;
      case '"':
        result += "&quot;";
        break;
      case '\'':
        result += "&#39;";
        break;
      case '\n':
        result += "<br>";
        break;
      case ' ':
        result += "&nbsp;";
        break;
      default:
        result += ch;
    }
  }

  return result;
}

std::string HighlightHtml(const std::string& text,
                          const std::vector<VeilCore::Detection>& detections) {
  std::string html;
  size_t last_end = 0;

  for (const auto& det : detections) {
    if (det.start < last_end || det.end > text.size()) {
      continue;  // not disjoint or out of range
    }

    html += EscapeHtml(text.substr(last_end, det.start - last_end));

    std::string color = VeilCore::PatternTypeColor(det.pattern_type);
    html += "<span class=\"detection\" data-type=\"";
    html += VeilCore::PatternTypeToId(det.pattern_type);
    html += "\" style=\"background-color: " + color + "20; border-bottom: 2px solid " + color +
            "; padding: 1px 2px; border-radius: 2px;\" title=\"";
    html += VeilCore::PatternTypeName(det.pattern_type);
    html += "\">";
    html += EscapeHtml(text.substr(det.start, det.end - det.start));
    html += "</span>";

    last_end = det.end;
  }

  if (last_end < text.size()) {
    html += EscapeHtml(text.substr(last_end));
  }

  return html;
}

}  // namespace VeilRender
