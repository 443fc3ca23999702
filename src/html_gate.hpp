#pragma once

#include "warc.hpp"

#include <optional>
#include <string>
#include <string_view>

bool isHtmlContentType(std::string_view contentType);

// <html, <body or <!doctype html within the first 4 KB, any case.
bool hasHtmlSignals(std::string_view text);

// The text when the content type says HTML or the body looks like HTML.
std::optional<std::string> acceptHtml(std::string text, const HeaderMap& headers);
