#include <gtest/gtest.h>

#include "veil_html_highlighter.h"

using VeilCore::Detection;
using VeilCore::PatternType;
using VeilRender::EscapeHtml;
using VeilRender::HighlightHtml;

namespace {

Detection MakeDetection(PatternType type, const std::string& value, size_t start) {
  Detection detection;
  detection.pattern_type = type;
  detection.value = value;
  detection.start = start;
  detection.end = start + value.size();
  return detection;
}

const char kIpv4Span[] =
    "<span class=\"detection\" data-type=\"ipv4\" style=\"background-color: #ff6b6b20; "
    "border-bottom: 2px solid #ff6b6b; padding: 1px 2px; border-radius: 2px;\" "
    "title=\"IPV4\">10.0.0.1</span>";

}  // namespace

TEST(EscapeHtmlTest, EscapesMarkupAndWhitespace) {
  EXPECT_EQ(EscapeHtml("a <b> & 'c'\n"),
            "a&nbsp;&lt;b&gt;&nbsp;&amp;&nbsp;&#39;c&#39;<br>");
  EXPECT_EQ(EscapeHtml("\"q\""), "&quot;q&quot;");
  EXPECT_EQ(EscapeHtml(""), "");
}

TEST(HighlightHtmlTest, WrapsDetection) {
  const std::string text = "from 10.0.0.1";
  auto html = HighlightHtml(text, {MakeDetection(PatternType::IPV4, "10.0.0.1", 5)});
  EXPECT_EQ(html, std::string("from&nbsp;") + kIpv4Span);
}

TEST(HighlightHtmlTest, NoDetectionsIsPlainEscape) {
  EXPECT_EQ(HighlightHtml("a<b", {}), "a&lt;b");
}

TEST(HighlightHtmlTest, SkipsOverlappingAndOutOfRange) {
  const std::string text = "10.0.0.1 x";
  auto html = HighlightHtml(text, {MakeDetection(PatternType::IPV4, "10.0.0.1", 0),
                                   MakeDetection(PatternType::HOSTNAME, "0.0.1", 3),
                                   MakeDetection(PatternType::EMAIL, "x@y.z", 9)});
  EXPECT_EQ(html, std::string(kIpv4Span) + "&nbsp;x");
}
