#include <treedelta-cpp/change_list.hpp>

#include <chrono>

namespace treedelta_cpp {

auto Timestamp::now() -> Timestamp {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
}

}  // namespace treedelta_cpp
