#include "system/signals.hpp"
#include "update/action_script.hpp"
#include "update/archive_extractor.hpp"
#include "update/extension_installer.hpp"
#include "update/extension_registry.hpp"
#include "update/http_transport.hpp"
#include "update/manifest_reader.hpp"
#include "update/progress_sinks.hpp"
#include "update/update_plan.hpp"
#include "util/config_parser.hpp"
#include "util/installation_id.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <limits>
#include <memory>
#include <optional>
#include <string>

namespace {

enum ExitCode : int {
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

enum LongOnly : int {
    kOptApplyPending = 1000,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] -i <id> [-u <url>] [-V <version>] [-n <name>] [-f <file>]\n"
        "      [-b <build>] [-s] [-p] [-d]\n"
        "   %s [-c <config>] --apply-pending\n"
        "\n"
        "Options:\n"
        "  -c, --config           Configuration file (default %s)\n"
        "  -i, --id               Extension id to update\n"
        "  -u, --url              Download URL (default: repository download URL)\n"
        "  -V, --version          Version offered by the catalog, skips the download when not newer\n"
        "  -n, --name             Display name\n"
        "  -f, --file-name        File name to store the download under\n"
        "  -b, --build            Host build to check compatibility against\n"
        "  -s, --force-https      Refuse plaintext downloads and redirects\n"
        "  -p, --progress         Show download progress\n"
        "  -d, --debug            Debug logging\n"
        "      --apply-pending    Run the actions scheduled by earlier updates and exit\n"
        "  -h, --help             Show this help\n",
        argv, argv, extupd::config::kDefaultConfigPath);
}

struct CliOptions {
    std::string config_path = extupd::config::kDefaultConfigPath;
    std::string id;
    std::optional<std::string> url;
    std::optional<std::string> version;
    std::optional<std::string> name;
    std::optional<std::string> file_name;
    std::optional<std::string> build;
    bool force_https = false;
    bool progress = false;
    bool debug = false;
    bool apply_pending = false;
};

int ApplyPending(const extupd::config::UpdaterConfigFromFile& cfg) {
    extupd::ActionScript script(cfg.action_script);
    extupd::ArchiveExtractor extractor;
    auto res = script.Replay(extractor);
    if (!res.is_ok()) {
        LogError("%s", res.msg.c_str());
        return kExitFailure;
    }
    return kExitOk;
}

int RunUpdate(const CliOptions& cli, const extupd::config::UpdaterConfigFromFile& cfg) {
    auto host_build = extupd::BuildNumber::Parse(cfg.build_number);
    if (!host_build) {
        LogError("BuildNumber '%s': %s", cfg.build_number.c_str(), host_build.error().c_str());
        return kExitFailure;
    }

    std::optional<extupd::BuildNumber> plan_build;
    if (cli.build) {
        auto parsed = extupd::BuildNumber::Parse(*cli.build);
        if (!parsed) {
            std::fprintf(stderr, "Invalid --build: %s\n", parsed.error().c_str());
            return kExitUsage;
        }
        plan_build = *parsed;
    }

    extupd::PackageManifestReader manifest_reader;
    extupd::ArchiveExtractor archive_extractor;

    extupd::ExtensionRegistry registry;
    if (auto r = registry.ScanDirectory(cfg.extensions_dir, manifest_reader); !r.is_ok()) {
        LogError("%s", r.msg.c_str());
        return kExitFailure;
    }
    if (!cfg.broken_list.empty()) {
        extupd::BrokenList broken;
        if (auto r = extupd::BrokenList::LoadFromFile(cfg.broken_list, broken); !r.is_ok()) {
            LogWarn("Known-broken list not loaded: %s", r.msg.c_str());
        } else {
            LogDebug("Known-broken releases: %zu", broken.Size());
            registry.SetBrokenList(std::move(broken));
        }
    }

    extupd::ActionScript action_script(cfg.action_script);
    extupd::ExtensionInstaller installer(cfg.extensions_dir);
    extupd::CurlHttpTransport transport;

    std::unique_ptr<extupd::IProgress> progress;
    if (!cfg.progress_file.empty()) {
        progress = std::make_unique<extupd::FileProgressSink>(cfg.progress_file);
    } else if (cli.progress || cfg.progress.value_or(false)) {
        progress = std::make_unique<extupd::ConsoleProgressSink>();
    }

    extupd::UpdateServices services{
        .registry = registry,
        .installer = installer,
        .action_log = action_script,
        .manifest_reader = manifest_reader,
        .archive_extractor = archive_extractor,
        .transport = transport,
        .progress = progress.get(),
        .settings = {
            .temp_dir = cfg.temp_dir,
            .host_build = *host_build,
            .first_launch = cfg.first_launch.value_or(false),
            .connect_timeout_sec = static_cast<long>(std::min<std::uint64_t>(
                cfg.connect_timeout_sec.value_or(0), std::numeric_limits<long>::max())),
        },
    };

    std::optional<extupd::UpdatePlan> plan;
    if (cli.url) {
        extupd::UpdatePlan::Hints hints;
        hints.version = cli.version;
        hints.file_name = cli.file_name;
        hints.name = cli.name;
        hints.build = plan_build;
        plan.emplace(extupd::UpdatePlan::ForExtension(cli.id, *cli.url, std::move(hints)));
    } else {
        if (cfg.repository_url.empty()) {
            LogError("No --url given and RepositoryUrl is not configured");
            return kExitFailure;
        }

        extupd::RepositoryConfig repository;
        repository.download_url = cfg.repository_url;
        repository.host_build = *host_build;
        if (auto r = extupd::LoadOrCreateInstallationId(cfg.installation_id_file, repository.installation_id);
            !r.is_ok()) {
            LogError("%s", r.msg.c_str());
            return kExitFailure;
        }

        extupd::ExtensionDescriptor catalog;
        catalog.id = cli.id;
        catalog.version = cli.version.value_or("");
        catalog.name = cli.name.value_or("");

        auto created = extupd::UpdatePlan::FromDescriptor(catalog, std::nullopt, plan_build, repository);
        if (!created) {
            LogError("Extension %s: %s", cli.id.c_str(), created.error().c_str());
            return kExitFailure;
        }
        plan.emplace(std::move(*created));
    }
    plan->SetForceHttps(cli.force_https || cfg.force_https.value_or(false));

    const extupd::PrepareOutcome outcome = plan->Prepare(services, extupd::ProcessCancelToken());
    extupd::ClearProgressLine();

    if (outcome.IsFailed()) {
        std::fprintf(stderr, "extension %s was not installed: %s\n",
                     plan->DisplayName().c_str(), outcome.result.msg.c_str());
        return kExitFailure;
    }
    if (outcome.IsRejected()) {
        LogInfo("Nothing to do for %s: %s", plan->Id().c_str(), outcome.result.msg.c_str());
        return kExitOk;
    }

    auto commit_res = plan->Commit(services);
    if (!commit_res.is_ok()) {
        std::fprintf(stderr, "extension %s was not installed: %s\n",
                     plan->DisplayName().c_str(), commit_res.msg.c_str());
        return kExitFailure;
    }

    LogInfo("Extension %s will be updated at next start", plan->DisplayName().c_str());
    return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
    extupd::InstallSignalHandlers();

    CliOptions cli;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"id", required_argument, nullptr, 'i'},
        {"url", required_argument, nullptr, 'u'},
        {"version", required_argument, nullptr, 'V'},
        {"name", required_argument, nullptr, 'n'},
        {"file-name", required_argument, nullptr, 'f'},
        {"build", required_argument, nullptr, 'b'},
        {"force-https", no_argument, nullptr, 's'},
        {"progress", no_argument, nullptr, 'p'},
        {"debug", no_argument, nullptr, 'd'},
        {"apply-pending", no_argument, nullptr, kOptApplyPending},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:i:u:V:n:f:b:spd", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'c': cli.config_path = optarg; break;
            case 'i': cli.id = optarg; break;
            case 'u': cli.url = optarg; break;
            case 'V': cli.version = optarg; break;
            case 'n': cli.name = optarg; break;
            case 'f': cli.file_name = optarg; break;
            case 'b': cli.build = optarg; break;
            case 's': cli.force_https = true; break;
            case 'p': cli.progress = true; break;
            case 'd': cli.debug = true; break;
            case kOptApplyPending: cli.apply_pending = true; break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (!cli.apply_pending && cli.id.empty()) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    extupd::config::UpdaterConfigFromFile cfg;
    std::string cfg_err;
    if (!cfg.LoadFile(cli.config_path, cfg_err)) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", cfg_err.c_str());
        return kExitFailure;
    }

    if (!cfg.log_level.empty()) {
        if (auto lvl = extupd::ParseLogLevel(cfg.log_level)) {
            extupd::Logger::Instance().SetLevel(*lvl);
        } else {
            std::fprintf(stderr, "WARN: unknown LogLevel '%s'\n", cfg.log_level.c_str());
        }
    }
    if (cli.debug) {
        extupd::Logger::Instance().SetLevel(extupd::LogLevel::Debug);
    }
    if (!cfg.log_file.empty()) {
        std::string log_err;
        if (!extupd::Logger::Instance().SetLogFile(cfg.log_file, log_err)) {
            std::fprintf(stderr, "WARN: %s\n", log_err.c_str());
        }
    }

    if (cli.apply_pending) {
        return ApplyPending(cfg);
    }
    return RunUpdate(cli, cfg);
}
