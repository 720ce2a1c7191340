#include <jsonpatch-cpp/pointer.hpp>

#include <jsonpatch-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// Pointer text codec
// =============================================================================

auto Pointer::escape(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto Pointer::unescape(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            result += token[i];
            continue;
        }
        if (i + 1 == token.size()) {
            throw InvalidPointer{"pointer token '" + std::string{token} + "' ends with '~'"};
        }
        switch (token[i + 1]) {
            case '0': result += '~'; break;
            case '1': result += '/'; break;
            default:
                throw InvalidPointer{"invalid escape '~" + std::string(1, token[i + 1]) +
                                     "' in pointer token '" + std::string{token} + "'"};
        }
        ++i;
    }
    return result;
}

auto Pointer::parse(std::string_view text) -> Pointer {
    if (text.empty()) return Pointer{};
    if (text[0] != '/') {
        throw InvalidPointer{"pointer '" + std::string{text} + "' must start with '/' or be empty"};
    }
    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        tokens.push_back(unescape(text.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result += '/';
        result += escape(token);
    }
    return result;
}

// =============================================================================
// Derived pointers
// =============================================================================

auto Pointer::parent() const -> Pointer {
    if (tokens_.empty()) return *this;
    return Pointer{std::vector<std::string>(tokens_.begin(), tokens_.end() - 1)};
}

auto Pointer::append(std::string token) const -> Pointer {
    auto tokens = tokens_;
    tokens.push_back(std::move(token));
    return Pointer{std::move(tokens)};
}

auto Pointer::append(std::size_t index) const -> Pointer {
    return append(std::to_string(index));
}

auto Pointer::with_back(std::string token) const -> Pointer {
    auto tokens = tokens_;
    tokens.back() = std::move(token);
    return Pointer{std::move(tokens)};
}

auto Pointer::contains(const Pointer& other) const -> bool {
    if (other.tokens_.size() > tokens_.size()) return false;
    return std::equal(other.tokens_.begin(), other.tokens_.end(), tokens_.begin());
}

auto parse_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

// =============================================================================
// Resolution
// =============================================================================

namespace {

// Shared by the const and non-const overloads; V is Value or const Value.
template <typename V>
auto walk_impl(V& container, std::string_view key) -> V& {
    if (container.is_object()) {
        auto it = container.find(std::string{key});
        if (it == container.end()) {
            throw PointerResolutionError{"member '" + std::string{key} + "' not found"};
        }
        return *it;
    }
    if (container.is_array()) {
        if (key == "-") {
            throw PointerResolutionError{"'-' addresses past the end of the array"};
        }
        auto idx = parse_index(key);
        if (!idx) {
            throw PointerResolutionError{"'" + std::string{key} + "' is not a valid array index"};
        }
        if (*idx >= container.size()) {
            throw PointerResolutionError{"index " + std::string{key} + " is out of range (size " +
                                         std::to_string(container.size()) + ")"};
        }
        return container[*idx];
    }
    throw PointerResolutionError{"cannot index into " + std::string{to_string_view(container.type())} +
                                 " with '" + std::string{key} + "'"};
}

template <typename V>
auto resolve_impl(V& doc, const Pointer& pointer) -> V& {
    V* current = &doc;
    for (const auto& token : pointer.tokens()) {
        current = &walk_impl(*current, token);
    }
    return *current;
}

}  // anonymous namespace

auto walk(Value& container, std::string_view key) -> Value& {
    return walk_impl(container, key);
}

auto walk(const Value& container, std::string_view key) -> const Value& {
    return walk_impl(container, key);
}

auto resolve_parent(Value& doc, const Pointer& pointer) -> Location {
    if (pointer.empty()) return Location{};
    auto& container = resolve_impl(doc, pointer.parent());
    return Location{.container = &container, .key = pointer.back()};
}

auto resolve(Value& doc, const Pointer& pointer) -> Value& {
    return resolve_impl(doc, pointer);
}

auto resolve(const Value& doc, const Pointer& pointer) -> const Value& {
    return resolve_impl(doc, pointer);
}

auto try_resolve(const Value& doc, const Pointer& pointer) -> const Value* {
    const auto* current = &doc;
    for (const auto& token : pointer.tokens()) {
        if (current->is_object()) {
            auto it = current->find(token);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else if (current->is_array()) {
            auto idx = parse_index(token);
            if (!idx || *idx >= current->size()) return nullptr;
            current = &(*current)[*idx];
        } else {
            return nullptr;
        }
    }
    return current;
}

// =============================================================================
// JSON serialization
// =============================================================================

void to_json(Value& j, const Pointer& p) {
    j = p.to_string();
}

void from_json(const Value& j, Pointer& p) {
    if (!j.is_string()) {
        throw InvalidPointer{"pointer must be a string, got " + std::string{j.type_name()}};
    }
    p = Pointer::parse(j.get_ref<const std::string&>());
}

}  // namespace jsonpatch_cpp
