// src/evaluator/Collector.cpp
#include <algorithm>
#include <unordered_set>

#include "evaluator.hpp"

// ----------------- Cycle collection -----------------

void Evaluator::track_function_frame(Environment* frame) {
    if (!frame || frame->tracked) return;
    frame->tracked = true;
    function_frames_.push_back(frame->weak_from_this());
}

void Evaluator::collect_cycles(const EnvPtr& root, const Value& keep) {
    // mark
    std::unordered_set<const Environment*> reachable;
    std::vector<const Environment*> pending;
    auto visit = [&pending](const Value& v) {
        if (auto fn = std::get_if<FunctionPtr>(&v)) {
            if (*fn && (*fn)->closure) pending.push_back((*fn)->closure.get());
        }
    };

    if (root) pending.push_back(root.get());
    visit(keep);
    while (!pending.empty()) {
        const Environment* e = pending.back();
        pending.pop_back();
        if (!reachable.insert(e).second) continue;
        if (e->parent) pending.push_back(e->parent.get());
        for (const auto& kv : e->values) visit(kv.second);
    }

    // sweep: clearing a frame drops its frame -> function edges, so the
    // cycle falls apart once `garbage` releases the last owners
    std::vector<std::weak_ptr<Environment>> live;
    std::vector<EnvPtr> garbage;
    for (const auto& w : function_frames_) {
        EnvPtr e = w.lock();
        if (!e) continue;
        if (reachable.count(e.get())) {
            live.push_back(w);
        } else {
            garbage.push_back(std::move(e));
        }
    }
    function_frames_ = std::move(live);

    for (auto& e : garbage) {
        e->values.clear();
        e->tracked = false;
    }
    garbage.clear();

    collect_threshold_ = std::max(MIN_COLLECT_THRESHOLD, function_frames_.size() * 2);
}

void Evaluator::maybe_collect_cycles(const EnvPtr& env) {
    if (call_depth_ != 0 || function_frames_.size() < collect_threshold_) return;
    collect_cycles(env);
}
