#pragma once

#include "io/scratch_dir.hpp"
#include "io/temp_file.hpp"
#include "system/cancel_token.hpp"
#include "update/action_script.hpp"
#include "update/archive_extractor.hpp"
#include "update/build_number.hpp"
#include "update/descriptor.hpp"
#include "update/extension_installer.hpp"
#include "update/extension_registry.hpp"
#include "update/http_transport.hpp"
#include "update/manifest_reader.hpp"
#include "update/progress.hpp"
#include "util/result.hpp"

#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace extupd {

struct UpdateSettings {
    // Each plan downloads into its own directory created below this one.
    std::string temp_dir;
    // Compatibility bound for plans that carry none of their own.
    BuildNumber host_build;
    // Startup wizard: installed versions are not consulted.
    bool first_launch = false;
    long connect_timeout_sec = 0;
};

// Collaborators a plan works against; all of them outlive the plan.
struct UpdateServices {
    IExtensionRegistry& registry;
    IExtensionInstaller& installer;
    IActionLog& action_log;
    const IManifestReader& manifest_reader;
    const IArchiveExtractor& archive_extractor;
    const IHttpTransport& transport;
    IProgress* progress = nullptr;
    UpdateSettings settings;
};

// Where catalog downloads come from when a descriptor has no usable URL.
struct RepositoryConfig {
    std::string download_url;
    std::string installation_id;
    BuildNumber host_build;
};

enum class PlanStatus { Fresh, Staged, Accepted, Rejected, Failed };

// Normal "nothing to do" outcomes, as opposed to failures.
enum class RejectReason {
    IncompatibleVersion,
    IncompatiblePlatform,
    AlreadyProcessed,
};

const char* PlanStatusName(PlanStatus status);
const char* RejectReasonName(RejectReason reason);

struct PrepareOutcome {
    PlanStatus status = PlanStatus::Fresh;
    std::optional<RejectReason> reason;
    // Failed: error kind and message. Rejected: diagnostic in msg.
    Result result;

    bool IsStaged() const { return status == PlanStatus::Staged; }
    bool IsRejected() const { return status == PlanStatus::Rejected; }
    bool IsFailed() const { return status == PlanStatus::Failed; }
};

// Download, inspect, compare and stage one extension update.
//
//   Fresh --Prepare--> Staged --Commit--> Accepted
//     |                  \
//     +--> Failed         +--> (Rejected when a check fails after download)
//     +--> Rejected
//
// A plan is driven by one thread at a time.
class UpdatePlan {
  public:
    struct Hints {
        std::optional<std::string> version;
        std::optional<std::string> file_name;
        std::optional<std::string> name;
        std::optional<BuildNumber> build;
    };

    static UpdatePlan ForExtension(std::string id, std::string url, Hints hints = {});

    // Plan for a catalog entry. The download URL is the descriptor URL
    // resolved against host when a host is given, otherwise the repository
    // download URL for the descriptor id.
    static std::expected<UpdatePlan, std::string> FromDescriptor(const ExtensionDescriptor& descriptor,
                                                                 const std::optional<std::string>& host,
                                                                 const std::optional<BuildNumber>& build,
                                                                 const RepositoryConfig& repository);

    UpdatePlan(UpdatePlan&&) noexcept = default;
    UpdatePlan& operator=(UpdatePlan&&) noexcept = default;
    UpdatePlan(const UpdatePlan&) = delete;
    UpdatePlan& operator=(const UpdatePlan&) = delete;

    PrepareOutcome Prepare(const UpdateServices& services, const CancelToken& cancel);

    // Only valid on a Staged plan; anything else throws std::logic_error.
    // Install errors are returned and leave the plan Staged.
    Result Commit(const UpdateServices& services);

    void SetForceHttps(bool force_https) { force_https_ = force_https; }
    void SetDescription(std::string description) { description_ = std::move(description); }
    void SetDepends(std::vector<std::string> depends) { depends_ = std::move(depends); }

    const std::string& Id() const { return id_; }
    const std::string& Url() const { return url_; }
    const std::optional<std::string>& Version() const { return version_; }
    const std::optional<BuildNumber>& Build() const { return build_; }
    const std::string& Description() const { return description_; }
    const std::vector<std::string>& Depends() const { return depends_; }
    bool ForceHttps() const { return force_https_; }

    // File name hint, or the last segment of the URL.
    std::string FileName() const;
    // Name hint, or the file name without its extension.
    std::string DisplayName() const;

    PlanStatus Status() const;
    // Downloaded file while Staged, empty otherwise.
    std::string StagedFile() const;
    // Directory holding the staged file, owned by this plan alone.
    std::string WorkDir() const;
    const std::optional<ExtensionDescriptor>& Descriptor() const { return descriptor_; }
    std::optional<std::string> SupersededPath() const;

    // Extracted descriptor when there is one, else a descriptor built from the
    // plan's own data.
    ExtensionDescriptor CatalogDescriptor() const;

  private:
    struct FreshState {};
    struct StagedState {
        // Declared first so the artifact inside it goes away before it.
        ScratchDir work_dir;
        TempFile artifact;
        std::optional<std::string> superseded_path;
    };
    struct AcceptedState {
        std::string installed_from;
    };
    struct RejectedState {
        RejectReason reason;
        std::string detail;
    };
    struct FailedState {
        Result error;
    };
    using State = std::variant<FreshState, StagedState, AcceptedState, RejectedState, FailedState>;

    UpdatePlan(std::string id, std::string url, Hints hints);

    PrepareOutcome Reject(RejectReason reason, std::string detail);
    PrepareOutcome Fail(Result error);
    PrepareOutcome CurrentOutcome() const;

    std::string id_;
    std::string url_;
    std::optional<std::string> version_;
    std::optional<std::string> file_name_;
    std::optional<std::string> name_;
    std::optional<BuildNumber> build_;
    bool force_https_ = false;

    std::string description_;
    std::vector<std::string> depends_;
    std::optional<ExtensionDescriptor> descriptor_;

    State state_;
};

} // namespace extupd
