#include <reactive/types/component.h>
#include <reactive/types/path.h>

#include <algorithm>
#include <cctype>

namespace reactive {
    std::optional<std::vector<std::string>> split_path(std::string_view path) {
        auto valid = std::all_of(path.begin(), path.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '.';
        });
        if (!valid) { return std::nullopt; }

        std::vector<std::string> segments;
        std::size_t start{0};
        while (true) {
            auto end = path.find('.', start);
            if (end == std::string_view::npos) {
                segments.emplace_back(path.substr(start));
                break;
            }
            segments.emplace_back(path.substr(start, end - start));
            start = end + 1;
        }
        return segments;
    }

    std::optional<Watcher::getter_type> parse_path(std::string_view path) {
        auto segments = split_path(path);
        if (!segments) { return std::nullopt; }
        return Watcher::getter_type{[segments = std::move(*segments)](Component &vm) {
            Value value{vm.get(segments.front())};
            for (std::size_t i = 1; i < segments.size(); ++i) {
                if (!value.truthy()) { return Value{}; }
                value = value.get(segments[i]);
            }
            return value;
        }};
    }
} // namespace reactive
