#pragma once

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace streamdl {

void setVerbose(bool verbose) noexcept;
[[nodiscard]] bool isVerbose() noexcept;

void logInfo(std::string_view msg);
void logError(std::string_view msg);

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    if (isVerbose()) {
        logInfo(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
    }
}

} // namespace streamdl
