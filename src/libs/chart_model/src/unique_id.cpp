#include <chart_model/unique_id.hpp>
#include <atomic>
#include <cstdint>

namespace chart_model {

std::string unique_id(const std::string& prefix) {
    static std::atomic<std::uint64_t> next{ 1 };
    return prefix + "_" + std::to_string(next.fetch_add(1));
}

} // namespace chart_model
