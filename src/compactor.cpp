#include <treedelta-cpp/compactor.hpp>
#include <treedelta-cpp/log.hpp>

#include <string>
#include <unordered_set>
#include <vector>

namespace treedelta_cpp {

auto optimize(const ChangeList& changes) -> ChangeList {
    const auto& ops = changes.operations;
    auto seen = std::unordered_set<std::string>{};
    auto keep = std::vector<bool>(ops.size(), false);

    for (auto i = ops.size(); i > 0; --i) {
        if (seen.insert(ops[i - 1].path.to_pointer()).second) {
            keep[i - 1] = true;
        }
    }

    auto result = ChangeList{};
    result.timestamp = changes.timestamp;
    result.checksum = changes.checksum;
    result.operations.reserve(seen.size());
    for (std::size_t i = 0; i < ops.size(); ++i) {
        if (keep[i]) result.operations.push_back(ops[i]);
    }

    logger()->debug("optimize: {} -> {} operation(s)", ops.size(), result.operations.size());
    return result;
}

}  // namespace treedelta_cpp
