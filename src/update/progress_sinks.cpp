#include "update/progress_sinks.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>

namespace extupd {

namespace {
std::atomic_bool g_progress_line_active{false};

int Percent(const ProgressEvent& e) {
    if (e.total == 0) return -1;
    const auto pct = static_cast<int>((e.done * 100ULL) / e.total);
    return pct > 100 ? 100 : pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    const int pct = Percent(e);
    if (pct == last_percent_ && pct >= 0)
        return;
    last_percent_ = pct;

    nlohmann::json status = {
        {"extension", std::string(e.extension)},
        {"bytes", e.done},
        {"total", e.total},
        {"percent", pct},
    };

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << status.dump();
    os.close();

    std::rename(tmp_path.c_str(), path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    const int pct = Percent(e);
    const std::uint64_t kib = e.done / 1024;
    if (pct >= 0 && pct == last_percent_)
        return;
    if (pct < 0 && kib == last_kib_ && e.done != 0)
        return;
    last_percent_ = pct;
    last_kib_ = kib;

    if (pct >= 0) {
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% (%llu KiB)",
                     (int)e.extension.size(),
                     e.extension.data(),
                     pct,
                     (unsigned long long)kib);
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %llu KiB",
                     (int)e.extension.size(),
                     e.extension.data(),
                     (unsigned long long)kib);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (pct >= 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace extupd
