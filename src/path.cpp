#include <treedelta-cpp/path.hpp>
#include <treedelta-cpp/error.hpp>

#include <algorithm>
#include <charconv>

namespace treedelta_cpp {

namespace {

// Unescape one pointer token: ~1 -> '/', ~0 -> '~'.
auto unescape_token(std::string_view token) -> std::string {
    auto out = std::string{};
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            out.push_back(token[i]);
            continue;
        }
        if (i + 1 < token.size() && token[i + 1] == '0') {
            out.push_back('~');
        } else if (i + 1 < token.size() && token[i + 1] == '1') {
            out.push_back('/');
        } else {
            throw PointerError{"invalid '~' escape in pointer token \"" +
                               std::string{token} + "\""};
        }
        ++i;
    }
    return out;
}

auto escape_token(std::string_view token) -> std::string {
    auto out = std::string{};
    out.reserve(token.size());
    for (auto c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

}  // anonymous namespace

auto parse_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

auto segment_text(const PathSegment& seg) -> std::string {
    if (const auto* key = std::get_if<std::string>(&seg)) return *key;
    return std::to_string(std::get<std::size_t>(seg));
}

auto segment_index(const PathSegment& seg) -> std::optional<std::size_t> {
    if (const auto* idx = std::get_if<std::size_t>(&seg)) return *idx;
    return parse_index(std::get<std::string>(seg));
}

auto Path::parse(std::string_view pointer) -> Path {
    auto result = Path{};
    if (pointer.empty()) return result;
    if (pointer[0] != '/') {
        throw PointerError{"pointer must be empty or start with '/': \"" +
                           std::string{pointer} + "\""};
    }
    auto pos = std::size_t{1};
    while (true) {
        auto next = pointer.find('/', pos);
        auto raw = pointer.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (auto idx = parse_index(raw)) {
            result.segments_.emplace_back(*idx);
        } else {
            result.segments_.emplace_back(unescape_token(raw));
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return result;
}

auto Path::to_pointer() const -> std::string {
    auto out = std::string{};
    for (const auto& seg : segments_) {
        out.push_back('/');
        if (const auto* key = std::get_if<std::string>(&seg)) {
            out += escape_token(*key);
        } else {
            out += std::to_string(std::get<std::size_t>(seg));
        }
    }
    return out;
}

auto Path::parent() const -> Path {
    if (segments_.empty()) return {};
    return Path{std::vector<PathSegment>(segments_.begin(), segments_.end() - 1)};
}

auto Path::child(PathSegment seg) const -> Path {
    auto result = *this;
    result.segments_.push_back(std::move(seg));
    return result;
}

auto Path::starts_with(const Path& other) const -> bool {
    if (other.size() > size()) return false;
    return std::equal(other.segments_.begin(), other.segments_.end(), segments_.begin());
}

auto operator/(const Path& p, int idx) -> Path {
    if (idx < 0) throw PointerError{"negative sequence index " + std::to_string(idx)};
    return p.child(static_cast<std::size_t>(idx));
}

}  // namespace treedelta_cpp
