#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace vaultrig {

struct StageRecord {
    std::string name;
    double      time_s  = 0.0;
    bool        ran     = false;
    bool        failed  = false;
    std::string message;
};

// One <testcase> per stage; stages that never ran are reported as skipped.
bool write_junit_report(const std::filesystem::path &path, const std::vector<StageRecord> &stages,
                        const std::vector<std::string> &cleanup_errors, std::string *error = nullptr);

} // namespace vaultrig
