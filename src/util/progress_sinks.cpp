#include "diagpack/util/progress_sinks.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace diagpack {

namespace {
std::atomic_bool g_progress_line_active{false};

int ClampPercent(int pct) {
    if (pct < 0) return 0;
    if (pct > 100) return 100;
    return pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    nlohmann::json j;
    j["stage"] = std::string(e.stage);
    j["percent"] = ClampPercent(e.percent);

    // Stage text carries package ids straight from the manifest.
    const std::string text = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;

    os << text;
    os.close();

    std::rename(tmp_path.c_str(), path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const int pct = ClampPercent(e.percent);

    std::fprintf(stderr,
                 "\r[%3d%%] %-60.*s",
                 pct,
                 (int)e.stage.size(),
                 e.stage.data());
    std::fflush(stderr);
    g_progress_line_active.store(true);

    if (pct >= 100 && last_percent_ < 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active.store(false);
    }
    last_percent_ = pct;
}

bool IsProgressLineActive() { return g_progress_line_active.load(); }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace diagpack
