#include "util/version_comparator.hpp"

#include <ranges>
#include <string_view>

namespace extupd {

namespace {

// Digit run without leading zeros, so "0", "00" and a missing segment all
// read as "". Digit runs of any length compare correctly as strings.
struct Segment {
    std::string_view digits;
    std::string_view suffix;
};

// "12rc1" -> {"12", "rc1"}; "beta" -> {"", "beta"}.
Segment ParseSegment(std::string_view sv) {
    size_t end = 0;
    while (end < sv.size() && sv[end] >= '0' && sv[end] <= '9') ++end;

    std::string_view digits = sv.substr(0, end);
    while (!digits.empty() && digits.front() == '0') digits.remove_prefix(1);
    return Segment{digits, sv.substr(end)};
}

int CompareNumbers(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return lhs.size() > rhs.size() ? 1 : -1;
    const int c = lhs.compare(rhs);
    return c == 0 ? 0 : (c > 0 ? 1 : -1);
}

} // namespace

int VersionComparator::Compare(const std::string& lhs, const std::string& rhs) {
    if (lhs == rhs)
        return 0;

    auto lhs_parts = lhs | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng); });
    auto rhs_parts = rhs | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng); });

    auto it_lhs = lhs_parts.begin();
    auto it_rhs = rhs_parts.begin();

    while (it_lhs != lhs_parts.end() || it_rhs != rhs_parts.end()) {
        Segment lhs_seg;
        Segment rhs_seg;

        if (it_lhs != lhs_parts.end()) {
            lhs_seg = ParseSegment(*it_lhs);
            ++it_lhs;
        }

        if (it_rhs != rhs_parts.end()) {
            rhs_seg = ParseSegment(*it_rhs);
            ++it_rhs;
        }

        const int number = CompareNumbers(lhs_seg.digits, rhs_seg.digits);
        if (number != 0)
            return number;

        const int text = lhs_seg.suffix.compare(rhs_seg.suffix);
        if (text != 0)
            return text > 0 ? 1 : -1;
    }

    return 0;
}

} // namespace extupd
