#include "workflow/job.hpp"
#include <queue>
#include <unordered_set>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace warden::workflow {

json Job::to_json() const {
    json j = json::object();
    j["name"] = name;
    if (!needs.empty()) j["needs"] = needs;
    if (!condition.empty()) j["if"] = condition;
    j["runs-on"] = runs_on;

    // Always present: an absent key inherits the repository default token
    j["permissions"] = permissions.to_json();

    if (!concurrency_group.empty()) j["concurrency"] = {{"group", concurrency_group}};
    if (timeout_minutes > 0) j["timeout-minutes"] = timeout_minutes;
    if (!env.empty()) j["env"] = env;
    j["steps"] = steps;
    if (!outputs.empty()) j["outputs"] = outputs;
    return j;
}

bool JobGraph::add_job(Job job) {
    if (job.name.empty()) {
        spdlog::warn("Rejected job with empty name");
        return false;
    }
    if (index_.count(job.name)) {
        spdlog::warn("Rejected duplicate job '{}'", job.name);
        return false;
    }
    index_[job.name] = jobs_.size();
    jobs_.push_back(std::move(job));
    return true;
}

const Job* JobGraph::get_job(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &jobs_[it->second];
}

GraphValidationResult JobGraph::validate() const {
    GraphValidationResult result;

    std::vector<size_t> in_degree(jobs_.size(), 0);
    std::vector<std::vector<size_t>> successors(jobs_.size());

    for (size_t i = 0; i < jobs_.size(); ++i) {
        for (const auto& need : jobs_[i].needs) {
            auto it = index_.find(need);
            if (it == index_.end()) {
                result.error = "job '" + jobs_[i].name + "' needs unknown job '" + need + "'";
                return result;
            }
            successors[it->second].push_back(i);
            ++in_degree[i];
        }
    }

    std::queue<size_t> ready;
    for (size_t i = 0; i < jobs_.size(); ++i) {
        if (in_degree[i] == 0) {
            ready.push(i);
        }
    }

    size_t processed = 0;
    while (!ready.empty()) {
        size_t current = ready.front();
        ready.pop();
        ++processed;
        for (size_t succ : successors[current]) {
            if (--in_degree[succ] == 0) {
                ready.push(succ);
            }
        }
    }

    // Jobs left with incoming edges sit on a cycle
    if (processed < jobs_.size()) {
        std::string involved;
        for (size_t i = 0; i < jobs_.size(); ++i) {
            if (in_degree[i] > 0) {
                if (!involved.empty()) involved += ", ";
                involved += jobs_[i].name;
            }
        }
        result.error = "dependency cycle between jobs: " + involved;
        return result;
    }

    result.success = true;
    return result;
}

bool JobGraph::depends_on(const std::string& job, const std::string& ancestor) const {
    auto start = index_.find(job);
    if (start == index_.end() || !index_.count(ancestor)) {
        return false;
    }

    // Iterative DFS along "needs" edges
    std::unordered_set<std::string> visited;
    std::vector<const Job*> stack = {&jobs_[start->second]};
    while (!stack.empty()) {
        const Job* current = stack.back();
        stack.pop_back();
        if (!visited.insert(current->name).second) {
            continue;
        }
        for (const auto& need : current->needs) {
            if (need == ancestor) {
                return true;
            }
            const Job* next = get_job(need);
            if (next && !visited.count(need)) {
                stack.push_back(next);
            }
        }
    }
    return false;
}

json JobGraph::to_json() const {
    json j = json::array();
    for (const auto& job : jobs_) {
        j.push_back(job.to_json());
    }
    return j;
}

} // namespace warden::workflow
