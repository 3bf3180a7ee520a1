#pragma once
#include <cstdint>
#include <string_view>

namespace extupd {

struct ProgressEvent {
    std::string_view extension;
    std::uint64_t done = 0;
    // 0 when the server sent no length.
    std::uint64_t total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace extupd
