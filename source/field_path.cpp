// field_path.cpp - FieldPath formatting and parsing

#include <deepeq/field_path.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace deepeq {

namespace {

bool is_array_index(std::string_view s)
{
    if (s.empty()) {
        return false;
    }
    return std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

[[noreturn]] void throw_parse_error(std::string_view text, std::size_t pos, std::string_view reason)
{
    throw std::invalid_argument("invalid field path '" + std::string{text} + "' at offset " +
                                std::to_string(pos) + ": " + std::string{reason});
}

} // anonymous namespace

FieldPath FieldPath::parse(std::string_view text)
{
    FieldPath path;
    std::size_t pos = 0;
    bool expect_field = true;  // at start or right after '.'

    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '[') {
            if (expect_field && pos != 0) {
                throw_parse_error(text, pos, "empty field name before '['");
            }
            auto close = text.find(']', pos + 1);
            if (close == std::string_view::npos) {
                throw_parse_error(text, pos, "missing ']'");
            }
            auto inner = text.substr(pos + 1, close - pos - 1);
            if (inner.empty()) {
                throw_parse_error(text, pos, "empty brackets");
            }
            if (is_array_index(inner)) {
                path.push_index(std::stoull(std::string{inner}));
            } else {
                path.push_key(std::string{inner});
            }
            pos = close + 1;
            expect_field = false;
        } else if (c == '.') {
            if (expect_field) {
                throw_parse_error(text, pos, "empty field name");
            }
            ++pos;
            expect_field = true;
        } else if (c == ']') {
            throw_parse_error(text, pos, "unexpected ']'");
        } else {
            if (!expect_field) {
                throw_parse_error(text, pos, "expected '.' or '['");
            }
            auto end = text.find_first_of(".[]", pos);
            if (end == std::string_view::npos) end = text.size();
            path.push_field(std::string{text.substr(pos, end - pos)});
            pos = end;
            expect_field = false;
        }
    }

    if (expect_field && !text.empty()) {
        throw_parse_error(text, text.size(), "trailing '.'");
    }
    return path;
}

void FieldPath::pop()
{
    if (!segments_.empty()) {
        segments_.pop_back();
    }
}

bool FieldPath::starts_with(const FieldPath& other) const
{
    if (other.size() > size()) {
        return false;
    }
    return std::equal(other.segments_.begin(), other.segments_.end(), segments_.begin());
}

std::string FieldPath::to_string() const
{
    std::string result;
    for (const auto& seg : segments_) {
        std::visit([&](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, FieldSegment>) {
                if (!result.empty()) result += '.';
                result += s.name;
            } else if constexpr (std::is_same_v<T, IndexSegment>) {
                result += "[" + std::to_string(s.index) + "]";
            } else {
                result += "[" + s.key + "]";
            }
        }, seg);
    }
    return result;
}

} // namespace deepeq
