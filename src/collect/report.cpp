#include "diagpack/collect/report.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>

namespace diagpack {

namespace {

nlohmann::json ErrorToJson(const CollectionError& e) {
    nlohmann::json j;
    j["kind"] = ActionKindName(e.kind);
    j["team"] = e.team;
    j["target"] = e.target;
    j["message"] = e.message;
    return j;
}

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& v) {
    if (!v)
        return nullptr;
    return *v;
}

} // namespace

nlohmann::json ReportToJson(const CollectionResult& result) {
    nlohmann::json j;
    j["outcome"] = RunOutcomeName(result.outcome);
    j["cancelled"] = result.cancelled;
    j["archive"] = OptionalToJson(result.archive_path);
    j["sha256"] = result.archive_sha256.empty() ? nlohmann::json(nullptr)
                                                : nlohmann::json(result.archive_sha256);
    j["error"] = OptionalToJson(result.fatal_error);

    nlohmann::json packages = nlohmann::json::object();
    for (const auto& [id, r] : result.per_package) {
        nlohmann::json p;
        p["files"] = r.files_collected;
        p["registries"] = r.registries_collected;
        p["eventLogs"] = r.event_logs_collected;
        p["commands"] = r.commands_collected;
        p["errors"] = nlohmann::json::array();
        for (const auto& e : r.errors)
            p["errors"].push_back(ErrorToJson(e));
        packages[id] = std::move(p);
    }
    j["packages"] = std::move(packages);
    return j;
}

Result WriteReportFile(const CollectionResult& result, const std::string& path) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good())
            return Result::Fail(-1, "Cannot write report: " + tmp_path);

        // Error messages and manifest text may carry bytes that are not UTF-8.
        std::string text;
        try {
            text = ReportToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const std::exception& e) {
            os.close();
            std::remove(tmp_path.c_str());
            return Result::Fail(-1, std::string("Cannot serialize report: ") + e.what());
        }
        os << text << '\n';
        os.close();
        if (os.fail()) {
            std::remove(tmp_path.c_str());
            return Result::Fail(-1, "Cannot write report: " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp_path.c_str());
        return Result::Fail(-e, "rename(" + path + ") failed: " + std::strerror(e));
    }
    return Result::Ok();
}

} // namespace diagpack
