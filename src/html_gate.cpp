#include "html_gate.hpp"
#include "charset.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>

bool isHtmlContentType(std::string_view contentType) {
    return Utils::containsIgnoreCase(contentType, "text/html") ||
           Utils::containsIgnoreCase(contentType, "application/xhtml+xml");
}

bool hasHtmlSignals(std::string_view text) {
    static constexpr std::array<std::string_view, 3> markers = {"<html", "<body", "<!doctype html"};
    std::string_view prefix = text.substr(0, std::min(text.size(), kSniffPrefixBytes));
    for (auto m : markers) {
        if (Utils::containsIgnoreCase(prefix, m)) return true;
    }
    return false;
}

std::optional<std::string> acceptHtml(std::string text, const HeaderMap& headers) {
    if (isHtmlContentType(headers.get("content-type")) || hasHtmlSignals(text)) {
        return text;
    }
    return std::nullopt;
}
