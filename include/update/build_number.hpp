#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace extupd {

// Host build identifier such as "IC-141.1234" or "141.*".
// "*" and "SNAPSHOT" components match anything at or below them.
class BuildNumber {
  public:
    static constexpr int kWildcard = 0x7fffffff;

    BuildNumber() = default;
    BuildNumber(std::string product_code, std::vector<int> components);

    static std::expected<BuildNumber, std::string> Parse(std::string_view text);

    const std::string& ProductCode() const { return product_code_; }
    const std::vector<int>& Components() const { return components_; }
    bool Empty() const { return components_.empty(); }

    // Product code does not take part in ordering.
    int CompareTo(const BuildNumber& other) const;

    std::string AsString() const;

  private:
    std::string product_code_;
    std::vector<int> components_;
};

} // namespace extupd
