#include "update/build_number.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>

namespace extupd {

namespace {

bool IsAllDigits(std::string_view s) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

BuildNumber::BuildNumber(std::string product_code, std::vector<int> components)
    : product_code_(std::move(product_code)), components_(std::move(components)) {}

std::expected<BuildNumber, std::string> BuildNumber::Parse(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' ||
                             text.back() == '\r'))
        text.remove_suffix(1);
    if (text.empty()) {
        return std::unexpected("empty build number");
    }

    std::string product;
    const auto dash = text.find('-');
    if (dash != std::string_view::npos) {
        product = std::string(text.substr(0, dash));
        text.remove_prefix(dash + 1);
    }

    std::vector<int> components;
    for (auto&& rng : text | std::views::split('.')) {
        const std::string_view part(rng);
        if (part == "*" || part == "SNAPSHOT") {
            components.push_back(kWildcard);
            continue;
        }
        if (!IsAllDigits(part)) {
            return std::unexpected("invalid build number component '" + std::string(part) + "'");
        }
        int value = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc() || ptr != part.data() + part.size()) {
            return std::unexpected("build number component out of range: " + std::string(part));
        }
        components.push_back(value);
    }

    return BuildNumber(std::move(product), std::move(components));
}

int BuildNumber::CompareTo(const BuildNumber& other) const {
    const size_t n = std::max(components_.size(), other.components_.size());
    for (size_t i = 0; i < n; ++i) {
        const int lhs = i < components_.size() ? components_[i] : 0;
        const int rhs = i < other.components_.size() ? other.components_[i] : 0;
        if (lhs == kWildcard || rhs == kWildcard) {
            // A wildcard swallows the remaining components.
            if (lhs == rhs) return 0;
            return lhs == kWildcard ? 1 : -1;
        }
        if (lhs != rhs) return lhs < rhs ? -1 : 1;
    }
    return 0;
}

std::string BuildNumber::AsString() const {
    std::string out;
    if (!product_code_.empty()) {
        out = product_code_ + "-";
    }
    for (size_t i = 0; i < components_.size(); ++i) {
        if (i > 0) out.push_back('.');
        out += components_[i] == kWildcard ? std::string("*") : std::to_string(components_[i]);
    }
    return out;
}

} // namespace extupd
