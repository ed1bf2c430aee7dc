#include <treedelta-cpp/checksum.hpp>

#include "crypto/sha256.hpp"

#include <nlohmann/json.hpp>

namespace treedelta_cpp {

namespace {

// nlohmann::json keeps object members in a std::map, so building one
// sorts keys for us.
auto to_canonical_json(const Value& value) -> nlohmann::json {
    return std::visit(overload{
        [](Null) { return nlohmann::json(nullptr); },
        [](bool b) { return nlohmann::json(b); },
        [](double d) {
            if (d == 0.0) d = 0.0;  // -0 and 0 compare equal; hash them alike
            return nlohmann::json(d);
        },
        [](const std::string& s) { return nlohmann::json(s); },
        [](const Sequence& seq) {
            auto arr = nlohmann::json::array();
            for (const auto& child : seq) arr.push_back(to_canonical_json(child));
            return arr;
        },
        [](const Mapping& map) {
            auto obj = nlohmann::json::object();
            for (const auto& [key, child] : map) obj[key] = to_canonical_json(child);
            return obj;
        },
    }, value.variant());
}

}  // anonymous namespace

auto sha256_hasher() -> Hasher {
    return [](std::span<const std::byte> bytes) -> Digest {
        auto digest = crypto::sha256(bytes);
        return Digest(digest.begin(), digest.end());
    };
}

auto canonical_form(const Value& value) -> std::string {
    return to_canonical_json(value).dump();
}

auto checksum(const Value& value, const Hasher& hasher) -> std::string {
    auto text = canonical_form(value);
    auto digest = hasher(std::as_bytes(std::span{text.data(), text.size()}));
    return to_hex(digest);
}

auto matches_checksum(const Value& value, std::string_view expected, const Hasher& hasher)
    -> bool {
    return checksum(value, hasher) == expected;
}

auto to_hex(std::span<const std::byte> bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        auto val = static_cast<unsigned char>(b);
        result.push_back(hex_chars[val >> 4]);
        result.push_back(hex_chars[val & 0x0F]);
    }
    return result;
}

}  // namespace treedelta_cpp
