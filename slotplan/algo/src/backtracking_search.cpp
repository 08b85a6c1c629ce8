#include <slotplan/algo/backtracking_search.hpp>

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace slotplan::algo {

BacktrackingSearch::BacktrackingSearch(AllocationContext& context, std::size_t node_limit)
    : context_(context)
    , node_limit_(node_limit) {}

std::vector<core::TaskIndex> BacktrackingSearch::order(std::span<const core::TaskIndex> tasks) const {
    std::vector<core::TaskIndex> ranked(tasks.begin(), tasks.end());
    std::sort(ranked.begin(), ranked.end(), [this](core::TaskIndex lhs, core::TaskIndex rhs) {
        const auto& a = context_.task(lhs);
        const auto& b = context_.task(rhs);
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        if (a.deadline != b.deadline) {
            if (!a.deadline || !b.deadline) {
                return a.deadline.has_value();
            }
            return *a.deadline < *b.deadline;
        }
        auto ea = a.effort().value_or(0);
        auto eb = b.effort().value_or(0);
        if (ea != eb) {
            return ea > eb;
        }
        return lhs < rhs;
    });
    return ranked;
}

std::vector<core::SlotIndex> BacktrackingSearch::candidate_starts(core::TaskIndex task) const {
    std::vector<core::SlotIndex> starts;
    auto range = context_.feasible_window(task);
    const auto* window = std::get_if<FeasibleWindow>(&range);
    if (!window) {
        return starts;
    }

    bool previous_free = false;
    for (core::SlotIndex s = window->first; s <= window->last; ++s) {
        bool free = context_.check_window(task, s).free();
        if (free && !previous_free) {
            starts.push_back(s);
        }
        previous_free = free;
    }
    return starts;
}

BacktrackingSearch::StateKey BacktrackingSearch::state_key() const {
    StateKey key(trail_);
    std::sort(key.begin(), key.end());
    return key;
}

void BacktrackingSearch::abandon(core::TaskIndex task, core::FailureReason reason, SearchResult& result) {
    if (reason == core::FailureReason::SearchExhausted || !context_.failure(task)) {
        context_.record_failure(task, reason);
    }
    result.abandoned.push_back(task);
}

void BacktrackingSearch::rollback() {
    for (auto it = trail_.rbegin(); it != trail_.rend(); ++it) {
        context_.unassign(it->first);
    }
    trail_.clear();
}

BacktrackingSearch::Outcome BacktrackingSearch::solve() {
    if (trail_.size() == set_.size()) {
        return Outcome::Solved;
    }
    if (nodes_ >= node_limit_) {
        return Outcome::Aborted;
    }
    ++nodes_;

    auto key = state_key();
    if (failed_.contains(key)) {
        return Outcome::Failed;
    }

    for (core::TaskIndex task : set_) {
        if (context_.is_completed(task) || !context_.dependencies_completed(task)) {
            continue;
        }
        for (core::SlotIndex start : candidate_starts(task)) {
            context_.commit(task, start);
            trail_.emplace_back(task, start);

            Outcome outcome = solve();
            if (outcome != Outcome::Failed) {
                return outcome;
            }

            trail_.pop_back();
            context_.unassign(task);
        }
    }

    failed_.insert(std::move(key));
    return Outcome::Failed;
}

SearchResult BacktrackingSearch::run(std::span<const core::TaskIndex> pending) {
    SearchResult result;
    nodes_ = 0;
    trail_.clear();

    set_.clear();
    for (core::TaskIndex task : order(pending)) {
        if (!context_.is_completed(task)) {
            set_.push_back(task);
        }
    }

    // A task whose dependency is neither placed nor searched for can never
    // become ready.
    bool pruned = true;
    while (pruned) {
        pruned = false;
        for (auto it = set_.begin(); it != set_.end(); ++it) {
            auto deps = context_.graph().dependencies(*it);
            bool reachable = std::all_of(deps.begin(), deps.end(), [this](core::TaskIndex dep) {
                return context_.is_completed(dep) || std::find(set_.begin(), set_.end(), dep) != set_.end();
            });
            if (!reachable) {
                abandon(*it, core::FailureReason::DependencyUnplaced, result);
                set_.erase(it);
                pruned = true;
                break;
            }
        }
    }

    context_.trace([&](core::TraceWriter& w) {
        w.type("search_started");
        w.field("tasks", static_cast<std::int64_t>(set_.size()));
        w.field("node_limit", static_cast<std::int64_t>(node_limit_));
    });

    while (!set_.empty()) {
        failed_.clear();
        Outcome outcome = solve();

        if (outcome == Outcome::Solved) {
            for (const auto& placement : trail_) {
                result.placed.push_back(placement.first);
            }
            trail_.clear();
            break;
        }

        if (outcome == Outcome::Aborted) {
            rollback();
            result.bounded = true;
            for (core::TaskIndex task : set_) {
                abandon(task, core::FailureReason::SearchExhausted, result);
            }
            set_.clear();
            break;
        }

        // Failed: every placement of the attempt has already been undone.
        // Give up on the lowest-ranked task and everything depending on it.
        std::vector<core::TaskIndex> dropped{set_.back()};
        for (std::size_t i = 0; i < dropped.size(); ++i) {
            for (core::TaskIndex dependent : context_.graph().dependents(dropped[i])) {
                bool in_set = std::find(set_.begin(), set_.end(), dependent) != set_.end();
                bool seen = std::find(dropped.begin(), dropped.end(), dependent) != dropped.end();
                if (in_set && !seen) {
                    dropped.push_back(dependent);
                }
            }
        }
        for (core::TaskIndex task : dropped) {
            context_.trace([&](core::TraceWriter& w) {
                w.type("search_rollback");
                w.field("task", std::string_view(context_.task(task).id));
            });
            abandon(task, task == dropped.front() ? core::FailureReason::NoFreeWindow
                                                  : core::FailureReason::DependencyUnplaced, result);
            set_.erase(std::find(set_.begin(), set_.end(), task));
        }
    }

    result.nodes = nodes_;
    return result;
}

} // namespace slotplan::algo
