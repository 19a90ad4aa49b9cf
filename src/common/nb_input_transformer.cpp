#include "pch.h"
#include "nb_input_transformer.hpp"

namespace nbimport {

namespace {

std::vector<std::string_view> SplitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string_view TrimLeft(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    return s.substr(i);
}

std::string_view Trim(std::string_view s) {
    s = TrimLeft(s);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

bool IsBlank(std::string_view s) {
    return Trim(s).empty();
}

bool HasPrompt(std::string_view line) {
    return line.starts_with(">>>") || line.starts_with("...");
}

std::string_view StripPrompt(std::string_view line) {
    if (!HasPrompt(line)) return line;
    line.remove_prefix(3);
    if (!line.empty() && line.front() == ' ') line.remove_prefix(1);
    return line;
}

// "%name rest of line" (leading `%` already removed) -> {name, args}
std::pair<std::string, std::string> SplitMagic(std::string_view text) {
    size_t i = 0;
    while (i < text.size() && text[i] != ' ' && text[i] != '\t') ++i;
    return {std::string(text.substr(0, i)), std::string(Trim(text.substr(i)))};
}

} // anonymous namespace

std::string InputTransformer::EscapeString(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\0': out += "\\0"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string InputTransformer::StripClassicPrompts(std::string_view raw) {
    auto lines = SplitLines(raw);

    auto first = std::find_if(lines.begin(), lines.end(),
                              [](std::string_view l) { return !IsBlank(l); });
    if (first == lines.end() || !first->starts_with(">>>")) {
        return std::string(raw);
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += StripPrompt(lines[i]);
    }
    return out;
}

std::string InputTransformer::TransformCell(std::string_view raw) const {
    const std::string stripped = StripClassicPrompts(raw);
    auto lines = SplitLines(stripped);

    // %%name args  (whole cell)
    if (!lines.empty() && lines.front().starts_with("%%")) {
        auto [name, args] = SplitMagic(Trim(lines.front()).substr(2));
        std::string body;
        for (size_t i = 1; i < lines.size(); ++i) {
            if (i > 1) body += '\n';
            body += lines[i];
        }
        return "__cell_magic__(" + EscapeString(name) + ", " + EscapeString(args) + ", " +
               EscapeString(body) + ")\n";
    }

    std::string out;
    out.reserve(stripped.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';

        std::string_view line = lines[i];
        std::string_view body = TrimLeft(line);
        if (body.size() > 1 && body.front() == '%' && body[1] != '%' && body[1] != ' ') {
            auto [name, args] = SplitMagic(Trim(body).substr(1));
            out += line.substr(0, line.size() - body.size());
            out += "__magic__(" + EscapeString(name) + ", " + EscapeString(args) + ")";
        } else {
            out += line;
        }
    }
    return out;
}

} // namespace nbimport
