#ifndef VEIL_HTML_HIGHLIGHTER_H_
#define VEIL_HTML_HIGHLIGHTER_H_

#include <string>
#include <vector>

#include "veil_detection.h"

namespace VeilRender {

/**
 * Escape text for inline display: & < > " ' become entities, newlines
 * become <br> and spaces become &nbsp; so log alignment survives.
 */
std::string EscapeHtml(const std::string& text);

/**
 * Render |text| as HTML with every detection wrapped in
 *
 *   <span class="detection" data-type="ID" style="..." title="NAME">VALUE</span>
 *
 * colored with the detection's category color. |detections| must be
 * disjoint and sorted by start, as returned by the anonymizer.
 */
std::string HighlightHtml(const std::string& text,
                          const std::vector<VeilCore::Detection>& detections);

}  // namespace VeilRender

#endif  // VEIL_HTML_HIGHLIGHTER_H_
