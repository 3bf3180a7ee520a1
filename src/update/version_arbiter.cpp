#include "update/version_arbiter.hpp"

#include "util/logger.hpp"
#include "util/version_comparator.hpp"

namespace extupd {

int VersionArbiter::Compare(const std::string& candidate_version, const ExtensionDescriptor& installed) const {
    int state = VersionComparator::Compare(candidate_version, installed.version);
    if (state <= 0 && registry_.IsKnownBroken(installed)) {
        LogInfo("Extension %s %s is known broken, allowing %s",
                installed.id.c_str(), installed.version.c_str(), candidate_version.c_str());
        state = 1;
    }
    return state;
}

} // namespace extupd
