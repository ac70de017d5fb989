#pragma once

#include <fmt/core.h>

#include <string>
#include <utility>
#include <vector>

#include "kconv_logger.hpp"

/**
 * @brief Collects the advisory messages raised during one conversion.
 *
 * Each message is logged at warning level when it is raised and kept so
 * that the caller receives the complete list alongside the converted
 * spectrum.
 */
class ConversionWarnings {
  public:
    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args &&...args) {
        add(fmt::format(format, std::forward<Args>(args)...));
    }

    void add(std::string message) {
        logger.warn(message);
        _messages.push_back(std::move(message));
    }

    void extend(const std::vector<std::string> &messages) {
        _messages.insert(_messages.end(), messages.begin(), messages.end());
    }

    bool empty() const {
        return _messages.empty();
    }
    const std::vector<std::string> &messages() const {
        return _messages;
    }
    std::vector<std::string> take() {
        return std::move(_messages);
    }

  private:
    std::vector<std::string> _messages;
};
