#include <slotplan/algo/lateness_refiner.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string_view>

namespace slotplan::algo {

namespace {

constexpr std::int64_t UNREACHABLE = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t SKIP_PENALTY = core::MINUTES_PER_WEEK;

} // anonymous namespace

LatenessRefiner::LatenessRefiner(AllocationContext& context, GreedyPlacer& greedy)
    : context_(context)
    , greedy_(greedy) {}

std::vector<core::TaskIndex> LatenessRefiner::select() const {
    std::vector<core::TaskIndex> candidates;
    auto tasks = context_.tasks();
    for (core::TaskIndex i = 0; i < tasks.size(); ++i) {
        const auto& t = tasks[i];
        if (context_.is_completed(i) || t.is_fixed() || !t.deadline || !t.effort()) {
            continue;
        }
        if (context_.dependencies_completed(i)) {
            candidates.push_back(i);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [&tasks](core::TaskIndex a, core::TaskIndex b) { return *tasks[a].deadline < *tasks[b].deadline; });
    return candidates;
}

std::vector<core::TaskIndex> LatenessRefiner::plan(const std::vector<core::TaskIndex>& candidates) const {
    const auto& grid = context_.grid();
    std::vector<core::SlotIndex> free_slots;
    for (const auto& slot : grid.slots()) {
        if (!slot.occupied()) {
            free_slots.push_back(slot.index);
        }
    }

    const std::size_t n = candidates.size();
    const std::size_t capacity = free_slots.size();
    const auto rest = static_cast<std::size_t>(grid.config().break_duration);

    std::vector<std::vector<std::int64_t>> dp(n + 1, std::vector<std::int64_t>(capacity + 1, UNREACHABLE));
    // Column each state was reached from; equal to its own column when the
    // candidate was left out
    std::vector<std::vector<std::size_t>> from(n + 1, std::vector<std::size_t>(capacity + 1, 0));
    dp[0][0] = 0;

    for (std::size_t i = 0; i < n; ++i) {
        const auto& task = context_.task(candidates[i]);
        const auto length = static_cast<std::size_t>(*task.effort());
        const auto cost = length + rest;

        for (std::size_t t = 0; t <= capacity; ++t) {
            if (dp[i][t] == UNREACHABLE) {
                continue;
            }
            // Leave the task out
            if (dp[i][t] + SKIP_PENALTY < dp[i + 1][t]) {
                dp[i + 1][t] = dp[i][t] + SKIP_PENALTY;
                from[i + 1][t] = t;
            }
            // Pack it right after the previous ones
            if (t + length > capacity) {
                continue;
            }
            core::Minute finish = grid.slot(free_slots[t + length - 1]).end;
            std::int64_t lateness = std::max<std::int64_t>(0, std::int64_t{finish} - *task.deadline);
            std::size_t next = std::min(t + cost, capacity);
            if (dp[i][t] + lateness < dp[i + 1][next]) {
                dp[i + 1][next] = dp[i][t] + lateness;
                from[i + 1][next] = t;
            }
        }
    }

    // Cheapest final state; ties go to the smallest consumption
    std::size_t best = 0;
    for (std::size_t t = 1; t <= capacity; ++t) {
        if (dp[n][t] < dp[n][best]) {
            best = t;
        }
    }

    std::vector<core::TaskIndex> chosen;
    std::size_t t = best;
    for (std::size_t i = n; i > 0; --i) {
        std::size_t prev = from[i][t];
        if (prev != t) {
            chosen.push_back(candidates[i - 1]);
        }
        t = prev;
    }
    std::reverse(chosen.begin(), chosen.end());
    return chosen;
}

std::size_t LatenessRefiner::refine() {
    auto chosen = plan(select());

    context_.trace([&](core::TraceWriter& w) {
        w.type("phase");
        w.field("name", std::string_view("lateness_refinement"));
        w.field("candidates", static_cast<std::int64_t>(chosen.size()));
    });

    std::size_t placed = 0;
    for (core::TaskIndex task : chosen) {
        if (greedy_.place(task) == PlacementOutcome::Placed) {
            ++placed;
        }
    }
    return placed;
}

} // namespace slotplan::algo
