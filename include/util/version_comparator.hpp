#pragma once

#include <string>

namespace extupd {

class VersionComparator {
public:
    // Dotted numeric comparison: "1.10" > "1.9", "1.0" == "1.0.0".
    // Returns <0, 0 or >0.
    static int Compare(const std::string& lhs, const std::string& rhs);
};

} // namespace extupd
