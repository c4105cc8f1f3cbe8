#pragma once

#include <string>
#include <string_view>

namespace mindarbor {

/// Kind of node content as far as sizing is concerned
enum class ContentKind {
    Text,     ///< Markdown text (default)
    Formula,  ///< `$$ ... $$` block, optionally followed by a fromLink comment
    Image     ///< Wiki embed `[[...]]` or markdown link/image `[..](..)`
};

const char* contentKindName(ContentKind kind);

/// True when the trimmed content is a display formula: it starts with `$$`,
/// the closing `$$` is followed only by whitespace and at most one
/// `<!-- fromLink:... -->` annotation.
bool isFormulaContent(std::string_view content);

/// True when the content contains a wiki embed or a markdown link/image
bool isImageContent(std::string_view content);

/// Formula wins over image, anything else is text
ContentKind classifyContent(std::string_view content);

/// Typography used by estimateTextNodeHeight()
struct TextMetrics {
    static constexpr float FONT_SIZE = 14.0f;
    static constexpr float LINE_HEIGHT = 26.0f;
    static constexpr float SAFETY_PADDING = 44.0f;
    static constexpr float MIN_NODE_HEIGHT = 60.0f;
    static constexpr float HORIZONTAL_PADDING = 40.0f;
    static constexpr float CJK_WIDTH_FACTOR = 1.15f;
    static constexpr float LATIN_WIDTH_FACTOR = 0.6f;
};

/// Estimate the rendered height of a text node without a DOM.
///
/// Each source line is measured after stripping a leading markdown heading
/// marker and emphasis characters; CJK ideographs count wider than other
/// characters. Blank lines count as half a line. The result is clamped to
/// [TextMetrics::MIN_NODE_HEIGHT, maxHeight].
float estimateTextNodeHeight(std::string_view content, float width, float maxHeight = 800.0f);

}  // namespace mindarbor
