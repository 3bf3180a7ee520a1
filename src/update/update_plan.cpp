#include "update/update_plan.hpp"

#include "update/artifact_fetcher.hpp"
#include "update/descriptor_extractor.hpp"
#include "update/install_stager.hpp"
#include "update/repository_url.hpp"
#include "update/version_arbiter.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <stdexcept>

namespace extupd {

const char* PlanStatusName(PlanStatus status) {
    switch (status) {
        case PlanStatus::Fresh:    return "fresh";
        case PlanStatus::Staged:   return "staged";
        case PlanStatus::Accepted: return "accepted";
        case PlanStatus::Rejected: return "rejected";
        case PlanStatus::Failed:   return "failed";
    }
    return "unknown";
}

const char* RejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::IncompatibleVersion:  return "incompatible-version";
        case RejectReason::IncompatiblePlatform: return "incompatible-platform";
        case RejectReason::AlreadyProcessed:     return "already-processed";
    }
    return "unknown";
}

UpdatePlan::UpdatePlan(std::string id, std::string url, Hints hints)
    : id_(std::move(id)),
      url_(std::move(url)),
      version_(std::move(hints.version)),
      file_name_(std::move(hints.file_name)),
      name_(std::move(hints.name)),
      build_(std::move(hints.build)) {}

UpdatePlan UpdatePlan::ForExtension(std::string id, std::string url, Hints hints) {
    return UpdatePlan(std::move(id), std::move(url), std::move(hints));
}

std::expected<UpdatePlan, std::string> UpdatePlan::FromDescriptor(const ExtensionDescriptor& descriptor,
                                                                  const std::optional<std::string>& host,
                                                                  const std::optional<BuildNumber>& build,
                                                                  const RepositoryConfig& repository) {
    if (descriptor.id.empty()) {
        return std::unexpected("descriptor has no id");
    }

    std::expected<std::string, std::string> url;
    if (host) {
        url = ResolveAgainstHost(*host, descriptor.url);
    } else {
        const BuildNumber& for_build = build ? *build : repository.host_build;
        url = BuildRepositoryDownloadUrl(repository.download_url,
                                         descriptor.id,
                                         for_build.AsString(),
                                         repository.installation_id);
    }
    if (!url) {
        return std::unexpected(url.error());
    }

    Hints hints;
    if (!descriptor.version.empty()) hints.version = descriptor.version;
    if (!descriptor.name.empty()) hints.name = descriptor.name;
    hints.build = build;

    UpdatePlan plan(descriptor.id, std::move(*url), std::move(hints));
    plan.description_ = descriptor.description;
    plan.depends_ = descriptor.depends;
    return plan;
}

std::string UpdatePlan::FileName() const {
    if (file_name_) return *file_name_;
    return LastPathSegment(url_);
}

std::string UpdatePlan::DisplayName() const {
    if (name_) return *name_;
    return NameWithoutExtension(FileName());
}

PlanStatus UpdatePlan::Status() const {
    switch (state_.index()) {
        case 0: return PlanStatus::Fresh;
        case 1: return PlanStatus::Staged;
        case 2: return PlanStatus::Accepted;
        case 3: return PlanStatus::Rejected;
        default: return PlanStatus::Failed;
    }
}

std::string UpdatePlan::StagedFile() const {
    if (const auto* staged = std::get_if<StagedState>(&state_)) {
        return staged->artifact.Path();
    }
    return {};
}

std::string UpdatePlan::WorkDir() const {
    if (const auto* staged = std::get_if<StagedState>(&state_)) {
        return staged->work_dir.Path();
    }
    return {};
}

std::optional<std::string> UpdatePlan::SupersededPath() const {
    if (const auto* staged = std::get_if<StagedState>(&state_)) {
        return staged->superseded_path;
    }
    return std::nullopt;
}

ExtensionDescriptor UpdatePlan::CatalogDescriptor() const {
    if (descriptor_) return *descriptor_;

    ExtensionDescriptor d;
    d.id = id_;
    d.name = DisplayName();
    d.version = version_.value_or("");
    d.description = description_;
    d.depends = depends_;
    d.url = url_;
    return d;
}

PrepareOutcome UpdatePlan::Reject(RejectReason reason, std::string detail) {
    LogInfo("Extension %s: %s (%s)", id_.c_str(), detail.c_str(), RejectReasonName(reason));
    state_ = RejectedState{reason, std::move(detail)};
    return CurrentOutcome();
}

PrepareOutcome UpdatePlan::Fail(Result error) {
    LogWarn("Extension %s was not downloaded: %s", id_.c_str(), error.msg.c_str());
    state_ = FailedState{std::move(error)};
    return CurrentOutcome();
}

PrepareOutcome UpdatePlan::CurrentOutcome() const {
    PrepareOutcome outcome;
    outcome.status = Status();
    if (const auto* rejected = std::get_if<RejectedState>(&state_)) {
        outcome.reason = rejected->reason;
        outcome.result.msg = rejected->detail;
    } else if (const auto* failed = std::get_if<FailedState>(&state_)) {
        outcome.result = failed->error;
    }
    return outcome;
}

PrepareOutcome UpdatePlan::Prepare(const UpdateServices& services, const CancelToken& cancel) {
    if (std::holds_alternative<StagedState>(state_) ||
        std::holds_alternative<RejectedState>(state_) ||
        std::holds_alternative<AcceptedState>(state_)) {
        return CurrentOutcome();
    }

    const UpdateSettings& settings = services.settings;
    const VersionArbiter arbiter(services.registry);

    std::optional<ExtensionDescriptor> installed;
    std::optional<std::string> superseded;
    if (!settings.first_launch && services.registry.IsInstalled(id_)) {
        installed = services.registry.GetInstalled(id_);
        if (!installed) {
            LogWarn("Extension %s reported installed but has no descriptor", id_.c_str());
        } else {
            if (version_ && arbiter.Compare(*version_, *installed) <= 0) {
                return Reject(RejectReason::IncompatibleVersion,
                              "already current: installed " + installed->version + ", offered " + *version_);
            }
            if (!installed->path.empty()) superseded = installed->path;
        }
    }

    // Plans never share a download directory, so equal file names cannot clash.
    ScratchDir work_dir;
    auto dir_res = ScratchDir::Create(settings.temp_dir, "plan_", work_dir);
    if (!dir_res.is_ok()) {
        return Fail(std::move(dir_res));
    }

    const ArtifactFetcher fetcher(services.transport, services.progress);
    FetchRequest request;
    request.url = url_;
    request.destination_dir = work_dir.Path();
    request.force_secure = force_https_;
    request.file_name_hint = file_name_;
    request.display_name = DisplayName();
    request.connect_timeout_sec = settings.connect_timeout_sec;

    TempFile artifact;
    auto fetch_res = fetcher.Fetch(request, cancel, artifact);
    if (!fetch_res.is_ok()) {
        return Fail(std::move(fetch_res));
    }
    file_name_ = std::filesystem::path(artifact.Path()).filename().string();

    const DescriptorExtractor extractor(services.manifest_reader, services.archive_extractor, work_dir.Path());
    std::optional<ExtensionDescriptor> actual;
    auto extract_res = extractor.Extract(artifact.Path(), actual);
    if (!extract_res.is_ok()) {
        return Fail(std::move(extract_res));
    }

    if (!actual) {
        // TODO(review): unknown-format downloads are accepted unverified; decide
        // whether legacy artifacts still need this before tightening it.
        LogWarn("Extension %s: no descriptor in %s, accepting as-is",
                id_.c_str(), artifact.Path().c_str());
        state_ = StagedState{std::move(work_dir), std::move(artifact), std::move(superseded)};
        return CurrentOutcome();
    }

    if (actual->id != id_) {
        LogWarn("Extension %s: downloaded package declares id %s", id_.c_str(), actual->id.c_str());
    }

    if (services.registry.WasUpdatedThisSession(actual->id)) {
        return Reject(RejectReason::AlreadyProcessed, "already updated in this session");
    }

    version_ = actual->version;
    name_ = actual->name;
    description_ = actual->description;
    depends_ = actual->depends;

    if (installed && arbiter.Compare(actual->version, *installed) <= 0) {
        return Reject(RejectReason::IncompatibleVersion,
                      "current version " + installed->version + " is not older than " + actual->version);
    }

    descriptor_ = *actual;

    const BuildNumber& bound = build_ ? *build_ : settings.host_build;
    if (services.registry.IsIncompatible(*actual, bound)) {
        return Reject(RejectReason::IncompatiblePlatform,
                      "incompatible with build " + bound.AsString() +
                          " (since:" + actual->since_build + " until:" + actual->until_build + ")");
    }

    LogInfo("Extension %s %s ready to install from %s",
            id_.c_str(), actual->version.c_str(), artifact.Path().c_str());
    state_ = StagedState{std::move(work_dir), std::move(artifact), std::move(superseded)};
    return CurrentOutcome();
}

Result UpdatePlan::Commit(const UpdateServices& services) {
    auto* staged = std::get_if<StagedState>(&state_);
    if (!staged || staged->artifact.Empty()) {
        throw std::logic_error("Commit() on extension " + id_ + " in state " + PlanStatusName(Status()));
    }

    InstallStager stager(services.action_log, services.installer, services.registry);
    auto res = stager.Stage(staged->superseded_path,
                            staged->artifact.Path(),
                            DisplayName(),
                            CatalogDescriptor(),
                            staged->work_dir.Path());
    if (!res.is_ok()) {
        LogError("Extension %s was not installed: %s", DisplayName().c_str(), res.msg.c_str());
        return res;
    }

    // The queued commands own the file and its directory from here on.
    std::string installed_from = staged->artifact.Release();
    staged->work_dir.Release();
    state_ = AcceptedState{std::move(installed_from)};
    return Result::Ok();
}

} // namespace extupd
