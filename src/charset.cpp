#include "charset.hpp"
#include "utils.hpp"

#include <iconv.h>

#include <algorithm>
#include <cerrno>
#include <utility>
#include <vector>

namespace {

// Longer labels are not real charset names.
constexpr size_t kMaxCharsetLabel = 64;

const char kReplacement[] = "\xEF\xBF\xBD";

using Attributes = std::vector<std::pair<std::string, std::string>>;

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

bool isLabelChar(char c) {
    char l = Utils::asciiLower(c);
    return (l >= 'a' && l <= 'z') || (l >= '0' && l <= '9') || l == '.' || l == '_' || l == ':' || l == '-';
}

// Attributes of one tag, starting just after the tag name. Names lowercased.
Attributes parseAttributes(std::string_view tag) {
    Attributes attrs;
    size_t i = 0;
    while (i < tag.size()) {
        while (i < tag.size() && (isSpace(tag[i]) || tag[i] == '/')) i++;
        if (i >= tag.size()) break;

        size_t nameStart = i;
        while (i < tag.size() && !isSpace(tag[i]) && tag[i] != '=' && tag[i] != '/') i++;
        std::string name = Utils::toLower(tag.substr(nameStart, i - nameStart));
        while (i < tag.size() && isSpace(tag[i])) i++;

        std::string value;
        if (i < tag.size() && tag[i] == '=') {
            i++;
            while (i < tag.size() && isSpace(tag[i])) i++;
            if (i < tag.size() && (tag[i] == '"' || tag[i] == '\'')) {
                char quote = tag[i++];
                size_t end = tag.find(quote, i);
                if (end == std::string_view::npos) end = tag.size();
                value = std::string(tag.substr(i, end - i));
                i = end + 1;
            } else {
                size_t valStart = i;
                while (i < tag.size() && !isSpace(tag[i])) i++;
                value = std::string(tag.substr(valStart, i - valStart));
            }
        }
        if (!name.empty()) attrs.emplace_back(std::move(name), Utils::trim(value));
    }
    return attrs;
}

const std::string* findAttr(const Attributes& attrs, const char* name) {
    for (const auto& a : attrs) {
        if (a.first == name) return &a.second;
    }
    return nullptr;
}

std::vector<Attributes> metaTags(std::string_view prefix) {
    std::vector<Attributes> tags;
    size_t pos = 0;
    while ((pos = Utils::findIgnoreCase(prefix, "<meta", pos)) != std::string_view::npos) {
        size_t attrStart = pos + 5;
        if (attrStart < prefix.size() && !isSpace(prefix[attrStart]) && prefix[attrStart] != '/') {
            pos = attrStart;
            continue;
        }
        size_t end = prefix.find('>', attrStart);
        if (end == std::string_view::npos) break;
        tags.push_back(parseAttributes(prefix.substr(attrStart, end - attrStart)));
        pos = end + 1;
    }
    return tags;
}

bool validCharsetName(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-' || c == ':';
        if (!ok) return false;
    }
    return true;
}

// Labels browsers treat as another encoding.
std::string canonicalCharset(const std::string& label) {
    if (label == "utf8" || label == "unicode-1-1-utf-8") return "utf-8";
    if (label == "iso-8859-1" || label == "iso8859-1" || label == "latin1" || label == "l1" ||
        label == "ascii" || label == "us-ascii" || label == "cp1252") {
        return "windows-1252";
    }
    if (label == "x-sjis" || label == "sjis") return "shift_jis";
    if (label == "gb2312" || label == "x-gbk") return "gbk";
    return label;
}

size_t utf8SequenceLength(const unsigned char* p, size_t n) {
    unsigned char c = p[0];
    if (c < 0x80) return 1;
    auto cont = [&](size_t k, unsigned char lo = 0x80, unsigned char hi = 0xBF) {
        return k < n && p[k] >= lo && p[k] <= hi;
    };
    if (c >= 0xC2 && c <= 0xDF) return cont(1) ? 2 : 0;
    if (c == 0xE0) return cont(1, 0xA0) && cont(2) ? 3 : 0;
    if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) return cont(1) && cont(2) ? 3 : 0;
    if (c == 0xED) return cont(1, 0x80, 0x9F) && cont(2) ? 3 : 0;
    if (c == 0xF0) return cont(1, 0x90) && cont(2) && cont(3) ? 4 : 0;
    if (c >= 0xF1 && c <= 0xF3) return cont(1) && cont(2) && cont(3) ? 4 : 0;
    if (c == 0xF4) return cont(1, 0x80, 0x8F) && cont(2) && cont(3) ? 4 : 0;
    return 0;
}

class IconvHandle {
public:
    explicit IconvHandle(const std::string& from) : cd_(iconv_open("UTF-8", from.c_str())) {}
    ~IconvHandle() {
        if (valid()) iconv_close(cd_);
    }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

} // namespace

std::string charsetFromContentType(std::string_view contentType) {
    size_t pos = 0;
    while ((pos = Utils::findIgnoreCase(contentType, "charset", pos)) != std::string_view::npos) {
        size_t i = pos + 7;
        pos = i;
        while (i < contentType.size() && isSpace(contentType[i])) i++;
        if (i >= contentType.size() || contentType[i] != '=') continue;
        i++;
        while (i < contentType.size() && isSpace(contentType[i])) i++;
        if (i < contentType.size() && (contentType[i] == '"' || contentType[i] == '\'')) i++;

        size_t start = i;
        while (i < contentType.size() && isLabelChar(contentType[i])) i++;
        if (i == start) continue;
        if (i - start > kMaxCharsetLabel) return {};
        return Utils::toLower(contentType.substr(start, i - start));
    }
    return {};
}

std::string charsetFromMeta(std::string_view body) {
    std::string_view prefix = body.substr(0, std::min(body.size(), kSniffPrefixBytes));
    auto tags = metaTags(prefix);

    for (const auto& attrs : tags) {
        const std::string* cs = findAttr(attrs, "charset");
        if (cs) {
            std::string v = Utils::toLower(*cs);
            if (validCharsetName(v)) return v;
        }
    }
    for (const auto& attrs : tags) {
        const std::string* equiv = findAttr(attrs, "http-equiv");
        const std::string* content = findAttr(attrs, "content");
        if (equiv && content && Utils::toLower(*equiv) == "content-type") {
            std::string v = charsetFromContentType(*content);
            if (!v.empty()) return v;
        }
    }
    return {};
}

std::string resolveCharset(std::string_view body, const HeaderMap& headers) {
    std::string cs = charsetFromContentType(headers.get("content-type"));
    if (cs.empty()) cs = charsetFromMeta(body);
    if (cs.empty()) cs = "utf-8";
    return cs;
}

std::string sanitizeUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        size_t len = utf8SequenceLength(p + i, n - i);
        if (len == 0) {
            out += kReplacement;
            i++;
        } else {
            out.append(bytes.data() + i, len);
            i += len;
        }
    }
    return out;
}

std::string decodeToUtf8(std::string_view bytes, const std::string& charset) {
    std::string target = canonicalCharset(Utils::toLower(charset));
    if (target == "utf-8") return sanitizeUtf8(bytes);

    IconvHandle cd(target);
    if (!cd.valid()) {
        Utils::log(Utils::LogLevel::Debug, "charset", "unsupported charset '" + charset + "', using utf-8");
        return sanitizeUtf8(bytes);
    }

    std::string input(bytes);
    char* in = input.empty() ? nullptr : &input[0];
    size_t inLeft = input.size();
    std::string out;
    char buf[16384];

    while (inLeft > 0) {
        char* outPtr = buf;
        size_t outLeft = sizeof(buf);
        size_t r = iconv(cd.get(), &in, &inLeft, &outPtr, &outLeft);
        int err = errno;
        out.append(buf, sizeof(buf) - outLeft);
        if (r != static_cast<size_t>(-1)) continue;

        if (err == E2BIG) continue;
        out += kReplacement;
        if (err == EILSEQ) {
            in++;
            inLeft--;
        } else {
            break; // EINVAL: truncated sequence at the end
        }
    }
    char* outPtr = buf;
    size_t outLeft = sizeof(buf);
    iconv(cd.get(), nullptr, nullptr, &outPtr, &outLeft);
    out.append(buf, sizeof(buf) - outLeft);
    return out;
}

std::string decodeText(std::string_view body, const HeaderMap& headers) {
    Utils::ScopedTimer t("Charset");
    return decodeToUtf8(body, resolveCharset(body, headers));
}
