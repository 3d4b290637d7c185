#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace T9 {

struct Namespace {
    std::string                name;
    std::string                state;
    std::optional<std::string> description;
    std::optional<std::string> owner_email;
    std::optional<std::string> retention;

    bool operator==(Namespace const&) const = default;
};

struct TaskQueuePoller {
    std::string identity;
    std::string last_access_time;
    double      rate_per_second{0.0};

    bool operator==(TaskQueuePoller const&) const = default;
};

struct TaskQueueInfo {
    std::string                  name;
    std::vector<TaskQueuePoller> pollers;
    std::optional<std::int64_t>  backlog_count_hint;

    bool operator==(TaskQueueInfo const&) const = default;
};

} // namespace T9
