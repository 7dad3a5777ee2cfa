#include <reactive/runtime/reactive_context.h>
#include <reactive/types/component.h>
#include <reactive/util/debug.h>

#include <cctype>
#include <cstdio>
#include <utility>
#include <vector>

namespace reactive {
    namespace {
        // "my-component" / "my_component" -> "MyComponent"
        std::string classify(std::string_view name) {
            std::string result;
            result.reserve(name.size());
            bool upper{true};
            for (char c : name) {
                if (c == '-' || c == '_') {
                    upper = true;
                    continue;
                }
                result += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
                upper = false;
            }
            return result;
        }
    } // namespace

    std::string format_component_name(const Component *vm) {
        if (vm == nullptr) { return "<Anonymous>"; }
        if (vm->parent() == nullptr) { return "<Root>"; }
        if (vm->name().empty()) { return "<Anonymous>"; }
        return fmt::format("<{}>", classify(vm->name()));
    }

    std::string generate_component_trace(const Component *vm) {
        if (vm == nullptr) { return {}; }
        if (vm->parent() == nullptr) { return fmt::format("\n\n(found in {})", format_component_name(vm)); }

        // Consecutive components with the same name collapse into one entry with a recursion count
        std::vector<std::pair<const Component *, std::size_t>> tree;
        for (auto cur = vm; cur != nullptr; cur = cur->parent()) {
            if (!tree.empty() && !cur->name().empty() && tree.back().first->name() == cur->name()) {
                ++tree.back().second;
                continue;
            }
            tree.emplace_back(cur, 0);
        }

        std::vector<std::string> lines;
        lines.reserve(tree.size());
        for (std::size_t i = 0; i < tree.size(); ++i) {
            auto &[cur, recursive] = tree[i];
            auto prefix = i == 0 ? std::string{"---> "} : std::string(5 + i * 2, ' ');
            if (recursive > 0) {
                lines.push_back(fmt::format("{}{}... ({} recursive calls)", prefix, format_component_name(cur),
                                            recursive + 1));
            } else {
                lines.push_back(fmt::format("{}{}", prefix, format_component_name(cur)));
            }
        }
        return fmt::format("\n\nfound in\n\n{}", fmt::join(lines, "\n"));
    }

    void warn(std::string_view msg, const Component *vm) {
        auto &config = ReactiveContext::instance().config();
        auto trace = generate_component_trace(vm);
        if (config.warn_handler) {
            config.warn_handler(msg, vm, trace);
        } else if (!config.silent) {
            fmt::print(stderr, "[reactive warn]: {}{}\n", msg, trace);
        }
    }

    void tip(std::string_view msg, const Component *vm) {
        if (ReactiveContext::instance().config().silent) { return; }
        fmt::print(stderr, "[reactive tip]: {}{}\n", msg, generate_component_trace(vm));
    }

    void log_error(const std::exception &error, const Component *vm, std::string_view info) {
        warn(vm, "Error in {}: \"{}\"", info, error.what());
        fmt::print(stderr, "{}\n", error.what());
    }

    namespace {
        void global_handle_error(const std::exception &error, Component *vm, std::string_view info) {
            auto &config = ReactiveContext::instance().config();
            if (config.error_handler) {
                try {
                    config.error_handler(error, vm, info);
                    return;
                } catch (const std::exception &e) {
                    log_error(e, nullptr, "config.error_handler");
                }
            }
            log_error(error, vm, info);
        }
    } // namespace

    void handle_error(const std::exception &error, Component *vm, std::string_view info) {
        if (vm != nullptr) {
            for (auto cur = vm->parent(); cur != nullptr; cur = cur->parent()) {
                // Copied, a hook may register further hooks
                auto hooks = cur->error_captured_hooks();
                for (const auto &hook : hooks) {
                    try {
                        if (!hook(error, *vm, info)) { return; }
                    } catch (const std::exception &e) {
                        global_handle_error(e, cur, "errorCaptured hook");
                    }
                }
            }
        }
        global_handle_error(error, vm, info);
    }
} // namespace reactive
