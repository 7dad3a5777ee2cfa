#include <reactive/runtime/reactive_context.h>
#include <reactive/types/subject.h>
#include <reactive/types/watcher.h>

#include <algorithm>
#include <atomic>

namespace reactive {
    namespace {
        std::atomic<subject_id_t> next_subject_id{0};
    }

    Subject::Subject(PrivateTag) : _id{next_subject_id++} {}

    Subject::s_ptr Subject::make() { return std::make_shared<Subject>(PrivateTag{}); }

    void Subject::add_sub(watcher_ptr sub) {
        if (sub == nullptr || std::find(_subs.begin(), _subs.end(), sub) != _subs.end()) { return; }
        _subs.push_back(sub);
    }

    void Subject::remove_sub(watcher_ptr sub) {
        auto it = std::find(_subs.begin(), _subs.end(), sub);
        if (it != _subs.end()) { _subs.erase(it); }
    }

    void Subject::depend() {
        if (auto target = current_target(); target != nullptr) { target->add_dep(*this); }
    }

    void Subject::notify() {
        // stabilize the subscriber list first, watchers may unsubscribe (or be released) while being updated
        std::vector<watcher_s_ptr> subs;
        subs.reserve(_subs.size());
        for (auto sub : _subs) {
            if (auto s = sub->weak_from_this().lock()) { subs.push_back(std::move(s)); }
        }
        for (auto &sub : subs) { sub->update(); }
    }

    void TargetStack::push(watcher_ptr target) { _stack.push_back(target); }

    void TargetStack::pop() {
        if (!_stack.empty()) { _stack.pop_back(); }
    }

    void push_target(watcher_ptr target) { ReactiveContext::instance().targets().push(target); }

    void pop_target() { ReactiveContext::instance().targets().pop(); }

    watcher_ptr current_target() { return ReactiveContext::instance().targets().current(); }

    TargetScope::TargetScope(watcher_ptr target) { push_target(target); }

    TargetScope::~TargetScope() { pop_target(); }
} // namespace reactive
