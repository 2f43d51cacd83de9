// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nzb/nzb_parser.hpp>
#include <nzbstream/nzb/media.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <optional>

namespace nzbstream::nzb {

namespace {

using core::StreamErrc;
using core::make_error_code;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtx = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

// Attribute value inside an opening tag, single or double quoted
std::optional<std::string_view> attribute(std::string_view tag, std::string_view name) noexcept {
    std::size_t pos = 0;
    while ((pos = tag.find(name, pos)) != std::string_view::npos) {
        auto after = pos + name.size();
        bool token_start = pos > 0 && std::isspace(static_cast<unsigned char>(tag[pos - 1]));
        if (token_start && after + 1 < tag.size() && tag[after] == '=' &&
            (tag[after + 1] == '"' || tag[after + 1] == '\'')) {
            char quote = tag[after + 1];
            auto end = tag.find(quote, after + 2);
            if (end == std::string_view::npos) return std::nullopt;
            return tag.substr(after + 2, end - after - 2);
        }
        pos = after;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> parse_number(std::string_view s) noexcept {
    s = trim(s);
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

// Next element "<tag ...>body</tag>" starting at pos; returns (open tag, body) and advances pos
struct Element {
    std::string_view open;
    std::string_view body;
};

enum class ScanResult { found, none, unterminated };

ScanResult next_element(std::string_view doc, std::string_view name, std::size_t& pos, Element& out) {
    std::string open_prefix = "<" + std::string(name);
    std::string close_tag = "</" + std::string(name) + ">";

    while (true) {
        auto start = doc.find(open_prefix, pos);
        if (start == std::string_view::npos) return ScanResult::none;

        auto after = start + open_prefix.size();
        // Reject longer names sharing the prefix (<files>, <segments>)
        if (after < doc.size() && doc[after] != '>' && doc[after] != '/' &&
            !std::isspace(static_cast<unsigned char>(doc[after]))) {
            pos = after;
            continue;
        }

        auto tag_end = doc.find('>', after);
        if (tag_end == std::string_view::npos) return ScanResult::unterminated;

        out.open = doc.substr(start, tag_end - start + 1);
        if (doc[tag_end - 1] == '/') {
            out.body = {};
            pos = tag_end + 1;
            return ScanResult::found;
        }

        auto close = doc.find(close_tag, tag_end + 1);
        if (close == std::string_view::npos) return ScanResult::unterminated;

        out.body = doc.substr(tag_end + 1, close - tag_end - 1);
        pos = close + close_tag.size();
        return ScanResult::found;
    }
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string hex_encode(const unsigned char* data, std::size_t size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::expected<NzbFile, std::error_code> parse_file(const Element& element, std::uint32_t index) {
    NzbFile file;
    file.index = index;

    if (auto subject = attribute(element.open, "subject")) {
        file.subject = decode_entities(*subject);
    }
    if (auto poster = attribute(element.open, "poster")) {
        file.poster = decode_entities(*poster);
    }
    if (auto date = attribute(element.open, "date")) {
        file.date = parse_number<std::int64_t>(*date).value_or(0);
    }
    file.name = extract_filename(file.subject);
    file.is_rar = is_rar_file(file.name);

    std::size_t pos = 0;
    Element child;
    ScanResult r;
    while ((r = next_element(element.body, "group", pos, child)) == ScanResult::found) {
        auto group = trim(child.body);
        if (!group.empty()) file.groups.push_back(decode_entities(group));
    }
    if (r == ScanResult::unterminated) {
        return std::unexpected(make_error_code(StreamErrc::invalid_nzb));
    }

    pos = 0;
    while ((r = next_element(element.body, "segment", pos, child)) == ScanResult::found) {
        auto bytes = attribute(child.open, "bytes");
        auto number = attribute(child.open, "number");
        auto id = decode_entities(trim(child.body));

        if (!bytes || !number || id.empty()) {
            spdlog::debug("NZB segment without bytes/number/id in file {}", file.name);
            return std::unexpected(make_error_code(StreamErrc::invalid_nzb));
        }

        auto b = parse_number<std::uint32_t>(*bytes);
        auto n = parse_number<std::uint32_t>(*number);
        if (!b || !n || *b == 0 || *n == 0) {
            return std::unexpected(make_error_code(StreamErrc::invalid_nzb));
        }

        if (id.size() >= 2 && id.front() == '<' && id.back() == '>') {
            id = id.substr(1, id.size() - 2);
        }
        file.segments.push_back({std::move(id), *b, *n});
    }
    if (r == ScanResult::unterminated || file.segments.empty()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_nzb));
    }

    // Stable so the first of duplicate numbers survives
    std::stable_sort(file.segments.begin(), file.segments.end(),
                     [](const NzbSegment& a, const NzbSegment& b) { return a.number < b.number; });
    file.segments.erase(std::unique(file.segments.begin(), file.segments.end(),
                                    [](const NzbSegment& a, const NzbSegment& b) { return a.number == b.number; }),
                        file.segments.end());

    for (const auto& seg : file.segments) {
        file.size += seg.bytes;
    }
    return file;
}

} // namespace

//=============================================================================
// Text helpers
//=============================================================================

std::string decode_entities(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }

        auto semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }

        auto entity = text.substr(i + 1, semi - i - 1);
        bool ok = true;
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else if (entity.size() > 1 && entity[0] == '#') {
            std::uint32_t cp = 0;
            auto digits = entity.substr(1);
            int base = 10;
            if (!digits.empty() && (digits[0] == 'x' || digits[0] == 'X')) {
                digits.remove_prefix(1);
                base = 16;
            }
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
            ok = ec == std::errc{} && ptr == digits.data() + digits.size() && cp > 0 && cp <= 0x10FFFF;
            if (ok) append_utf8(out, cp);
        } else {
            ok = false;
        }

        if (ok) {
            i = semi + 1;
        } else {
            out += text[i++];
        }
    }
    return out;
}

std::string extract_filename(std::string_view subject) {
    subject = trim(subject);

    // Quoted filename: take the last quoted part
    auto last = subject.rfind('"');
    if (last != std::string_view::npos && last > 0) {
        auto first = subject.rfind('"', last - 1);
        if (first != std::string_view::npos) {
            auto name = trim(subject.substr(first + 1, last - first - 1));
            if (!name.empty()) return std::string(name);
        }
    }

    // "blah blah filename.ext yEnc (1/10)"
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < subject.size()) {
        auto end = subject.find(' ', pos);
        if (end == std::string_view::npos) end = subject.size();
        if (end > pos) tokens.push_back(subject.substr(pos, end - pos));
        pos = end + 1;
    }

    while (!tokens.empty()) {
        auto t = tokens.back();
        bool counter = t.size() >= 3 && (t.front() == '(' || t.front() == '[') &&
                       (t.back() == ')' || t.back() == ']') && t.find('/') != std::string_view::npos;
        if (counter || iequals(t, "yenc") || t == "-") {
            tokens.pop_back();
            continue;
        }
        return std::string(t);
    }
    return std::string(subject);
}

//=============================================================================
// NZB
//=============================================================================

std::string nzb_hash(const std::vector<NzbFile>& files) {
    std::vector<std::string_view> ids;
    for (const auto& f : files) {
        for (const auto& s : f.segments) ids.push_back(s.message_id);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    EvpMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return {};
    }
    for (auto id : ids) {
        EVP_DigestUpdate(ctx.get(), id.data(), id.size());
        EVP_DigestUpdate(ctx.get(), "\n", 1);
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) {
        return {};
    }
    return hex_encode(md, len);
}

ParsedNzb make_parsed_nzb(std::vector<NzbFile> files) {
    ParsedNzb nzb;
    nzb.hash = nzb_hash(files);

    for (const auto& f : files) {
        nzb.total_size += f.size;
        nzb.groups.insert(nzb.groups.end(), f.groups.begin(), f.groups.end());
        if (!f.is_rar && is_media_file(f.name)) {
            nzb.media_files.push_back(f);
        }
    }
    std::sort(nzb.groups.begin(), nzb.groups.end());
    nzb.groups.erase(std::unique(nzb.groups.begin(), nzb.groups.end()), nzb.groups.end());

    nzb.files = std::move(files);
    return nzb;
}

std::expected<ParsedNzb, std::error_code>
parse_nzb(std::string_view xml) noexcept {
    try {
        if (xml.find("<nzb") == std::string_view::npos) {
            return std::unexpected(make_error_code(StreamErrc::invalid_nzb));
        }

        std::vector<NzbFile> files;
        std::size_t pos = 0;
        Element element;
        ScanResult r;
        while ((r = next_element(xml, "file", pos, element)) == ScanResult::found) {
            auto file = parse_file(element, static_cast<std::uint32_t>(files.size()));
            if (!file) return std::unexpected(file.error());
            files.push_back(std::move(*file));
        }

        if (r == ScanResult::unterminated || files.empty()) {
            return std::unexpected(make_error_code(StreamErrc::invalid_nzb));
        }

        auto nzb = make_parsed_nzb(std::move(files));
        spdlog::debug("Parsed NZB {}: {} files, {} media, {} bytes",
                      nzb.hash.substr(0, 12), nzb.files.size(), nzb.media_files.size(), nzb.total_size);
        return nzb;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
}

bool is_rar_only(const ParsedNzb& nzb) noexcept {
    if (!nzb.media_files.empty()) return false;
    return std::any_of(nzb.files.begin(), nzb.files.end(), [](const NzbFile& f) { return f.is_rar; });
}

const NzbFile* best_streamable_file(const ParsedNzb& nzb) noexcept {
    const NzbFile* best = nullptr;
    for (const auto& f : nzb.media_files) {
        if (!best || f.size > best->size) best = &f;
    }
    return best;
}

const NzbFile* find_file(const ParsedNzb& nzb, std::uint32_t index) noexcept {
    for (const auto& f : nzb.files) {
        if (f.index == index) return &f;
    }
    return nullptr;
}

} // namespace nzbstream::nzb
