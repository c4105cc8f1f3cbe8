#include "mindarbor/content/ContentKind.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace mindarbor {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// UTF-8 no-break space and ideographic space count as whitespace too
constexpr std::string_view kNoBreakSpace = "\xC2\xA0";
constexpr std::string_view kIdeographicSpace = "\xE3\x80\x80";

/// Length of the whitespace sequence starting at `pos`, 0 if none
size_t spaceLengthAt(std::string_view s, size_t pos) {
    if (pos >= s.size()) return 0;
    if (isSpace(s[pos])) return 1;
    std::string_view rest = s.substr(pos);
    if (rest.starts_with(kNoBreakSpace)) return kNoBreakSpace.size();
    if (rest.starts_with(kIdeographicSpace)) return kIdeographicSpace.size();
    return 0;
}

/// Length of the whitespace sequence ending just before `end`, 0 if none
size_t spaceLengthBefore(std::string_view s, size_t end) {
    if (end == 0 || end > s.size()) return 0;
    if (isSpace(s[end - 1])) return 1;
    std::string_view head = s.substr(0, end);
    if (head.ends_with(kNoBreakSpace)) return kNoBreakSpace.size();
    if (head.ends_with(kIdeographicSpace)) return kIdeographicSpace.size();
    return 0;
}

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end) {
        size_t n = spaceLengthAt(s, begin);
        if (n == 0) break;
        begin += n;
    }
    while (end > begin) {
        size_t n = spaceLengthBefore(s, end);
        if (n == 0 || end - n < begin) break;
        end -= n;
    }
    return s.substr(begin, end - begin);
}

size_t skipSpaceBackward(std::string_view s, size_t end) {
    while (end > 0) {
        size_t n = spaceLengthBefore(s, end);
        if (n == 0) break;
        end -= n;
    }
    return end;
}

constexpr std::string_view kFormulaDelimiter = "$$";
constexpr std::string_view kFromLinkOpen = "<!-- fromLink:";
constexpr std::string_view kCommentClose = "-->";

/// True when a closing `$$` ends exactly at `end`, past the opening one
bool closesFormulaAt(std::string_view s, size_t end) {
    return end >= 2 * kFormulaDelimiter.size() &&
           s.substr(end - kFormulaDelimiter.size(), kFormulaDelimiter.size()) == kFormulaDelimiter;
}

/// Wiki embed `[[...]]` or markdown link `[...](...)` within a single line
bool lineHasLink(std::string_view line) {
    size_t embed = line.find("[[");
    if (embed != std::string_view::npos && line.find("]]", embed + 2) != std::string_view::npos) {
        return true;
    }

    size_t open = line.find('[');
    if (open == std::string_view::npos) return false;
    size_t close = line.find("](", open + 1);
    if (close == std::string_view::npos) return false;
    return line.find(')', close + 2) != std::string_view::npos;
}

/// Decode UTF-8 into code points; malformed bytes decode as themselves
std::vector<char32_t> decodeUtf8(std::string_view s) {
    std::vector<char32_t> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        auto lead = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        char32_t cp = lead;
        if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }

        bool valid = i + extra < s.size();
        for (size_t k = 1; valid && k <= extra; ++k) {
            auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        if (!valid) {
            extra = 0;
            cp = lead;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

bool isCjkIdeograph(char32_t cp) {
    return cp >= 0x4E00 && cp <= 0x9FA5;
}

/// Strip `# ` style heading markers and emphasis/code characters
std::string stripMarkdown(std::string_view line) {
    size_t hashes = 0;
    while (hashes < line.size() && hashes < 7 && line[hashes] == '#') ++hashes;
    if (hashes >= 1 && hashes <= 6 && hashes < line.size() && isSpace(line[hashes])) {
        size_t pos = hashes;
        while (pos < line.size() && isSpace(line[pos])) ++pos;
        line = line.substr(pos);
    }

    std::string clean;
    clean.reserve(line.size());
    for (char c : line) {
        if (c != '*' && c != '_' && c != '`') {
            clean += c;
        }
    }
    return clean;
}

}  // namespace

const char* contentKindName(ContentKind kind) {
    switch (kind) {
        case ContentKind::Text: return "text";
        case ContentKind::Formula: return "formula";
        case ContentKind::Image: return "image";
    }
    return "text";
}

bool isFormulaContent(std::string_view content) {
    std::string_view trimmed = trim(content);
    if (!trimmed.starts_with(kFormulaDelimiter)) return false;

    // Trimmed text cannot end in whitespace, so either the formula closes at
    // the very end or a fromLink comment follows the closing delimiter.
    if (closesFormulaAt(trimmed, trimmed.size())) return true;
    if (!trimmed.ends_with(kCommentClose)) return false;

    const size_t lastOpen = trimmed.size() - kCommentClose.size();
    for (size_t pos = trimmed.find(kFromLinkOpen); pos != std::string_view::npos;
         pos = trimmed.find(kFromLinkOpen, pos + 1)) {
        if (pos + kFromLinkOpen.size() > lastOpen) break;
        if (closesFormulaAt(trimmed, skipSpaceBackward(trimmed, pos))) return true;
    }
    return false;
}

bool isImageContent(std::string_view content) {
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find_first_of("\r\n", start);
        if (end == std::string_view::npos) end = content.size();
        if (lineHasLink(content.substr(start, end - start))) return true;
        start = end + 1;
    }
    return false;
}

ContentKind classifyContent(std::string_view content) {
    if (isFormulaContent(content)) return ContentKind::Formula;
    if (isImageContent(content)) return ContentKind::Image;
    return ContentKind::Text;
}

float estimateTextNodeHeight(std::string_view content, float width, float maxHeight) {
    const float contentWidth = width - TextMetrics::HORIZONTAL_PADDING;
    float totalLines = 0.0f;

    size_t start = 0;
    while (start <= content.size()) {
        size_t newline = content.find('\n', start);
        size_t end = newline == std::string_view::npos ? content.size() : newline;
        std::string_view line = trim(content.substr(start, end - start));

        if (line.empty()) {
            totalLines += 0.5f;
        } else {
            float pixelWidth = 0.0f;
            for (char32_t cp : decodeUtf8(stripMarkdown(line))) {
                pixelWidth += TextMetrics::FONT_SIZE * (isCjkIdeograph(cp)
                    ? TextMetrics::CJK_WIDTH_FACTOR
                    : TextMetrics::LATIN_WIDTH_FACTOR);
            }
            float linesNeeded = std::ceil(pixelWidth / contentWidth);
            totalLines += std::max(1.0f, linesNeeded);
        }

        if (newline == std::string_view::npos) break;
        start = newline + 1;
    }

    float height = std::ceil(totalLines * TextMetrics::LINE_HEIGHT + TextMetrics::SAFETY_PADDING);
    return std::max(TextMetrics::MIN_NODE_HEIGHT, std::min(height, maxHeight));
}

}  // namespace mindarbor
