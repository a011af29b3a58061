#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/permissions.hpp"

namespace warden::workflow {

// Well-known job names
inline constexpr const char* kPreActivationJobName = "pre_activation";
inline constexpr const char* kActivationJobName = "activation";
inline constexpr const char* kAgentJobName = "agent";

struct Job {
    std::string name;
    std::string runs_on = "ubuntu-slim";
    std::vector<std::string> needs;
    Permissions permissions;
    std::string condition;                      // empty: always runs when needs succeed
    std::map<std::string, std::string> env;
    std::vector<nlohmann::json> steps;          // opaque to the graph
    std::map<std::string, std::string> outputs;
    std::string concurrency_group;
    int timeout_minutes = 0;

    nlohmann::json to_json() const;
};

struct GraphValidationResult {
    bool success = false;
    std::string error;
};

// Ordered set of jobs. Jobs are immutable once added.
class JobGraph {
public:
    // False for an empty or duplicate name
    bool add_job(Job job);

    const Job* get_job(const std::string& name) const;
    bool has_job(const std::string& name) const { return index_.count(name) > 0; }
    const std::vector<Job>& jobs() const { return jobs_; }
    size_t size() const { return jobs_.size(); }

    // Every "needs" entry names a known job and the edges form no cycle.
    GraphValidationResult validate() const;

    // True when job reaches ancestor through "needs" edges.
    bool depends_on(const std::string& job, const std::string& ancestor) const;

    nlohmann::json to_json() const;

private:
    std::vector<Job> jobs_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace warden::workflow
