#include "vaultrig/report.h"

#include <fstream>
#include <system_error>

#include <fmt/format.h>

namespace vaultrig {

namespace {

std::string escape_xml(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out.push_back(ch); break;
        }
    }
    return out;
}

// CDATA cannot hold "]]>"; split it across two sections.
std::string escape_cdata(std::string_view s) {
    std::string out;
    std::size_t pos = 0;
    while (true) {
        const auto hit = s.find("]]>", pos);
        if (hit == std::string_view::npos) {
            out.append(s.substr(pos));
            return out;
        }
        out.append(s.substr(pos, hit - pos));
        out.append("]]]]><![CDATA[>");
        pos = hit + 3;
    }
}

} // namespace

bool write_junit_report(const std::filesystem::path &path, const std::vector<StageRecord> &stages,
                        const std::vector<std::string> &cleanup_errors, std::string *error) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (error)
            *error = fmt::format("cannot write '{}'", path.string());
        return false;
    }

    std::size_t total_fail = 0;
    std::size_t total_skip = 0;
    double      total_time = 0.0;
    for (const auto &it : stages) {
        if (!it.ran)
            ++total_skip;
        if (it.failed)
            ++total_fail;
        total_time += it.time_s;
    }
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << fmt::format("<testsuite name=\"vaultrig\" tests=\"{}\" failures=\"{}\" skipped=\"{}\" errors=\"{}\" time=\"{:.3f}\">\n",
                       stages.size(), total_fail, total_skip, cleanup_errors.size(), total_time);
    for (const auto &it : stages) {
        out << fmt::format("  <testcase classname=\"vaultrig.run\" name=\"{}\" time=\"{:.3f}\">\n", escape_xml(it.name), it.time_s);
        if (!it.ran)
            out << "    <skipped/>\n";
        if (it.failed)
            out << "    <failure message=\"" << escape_xml(it.message) << "\"><![CDATA[" << escape_cdata(it.message)
                << "]]></failure>\n";
        out << "  </testcase>\n";
    }
    if (!cleanup_errors.empty()) {
        out << "  <system-err><![CDATA[";
        for (const auto &msg : cleanup_errors) {
            out << escape_cdata(msg) << "\n";
        }
        out << "]]></system-err>\n";
    }
    out << "</testsuite>\n";
    out.flush();
    if (!out) {
        if (error)
            *error = fmt::format("cannot write '{}'", path.string());
        return false;
    }
    return true;
}

} // namespace vaultrig
