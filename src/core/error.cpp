/// @file error.cpp
/// @brief Error handling implementation for drape_core
///
/// The error system is primarily template-based and header-only.
/// This file provides error formatting and the common Result instantiations.

#include <drape_engine/core/error.hpp>
#include <sstream>

namespace drape_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_system_error(const SystemError& err) {
    std::ostringstream oss;
    oss << "[SystemError] " << err.message;
    if (!err.system_id.empty()) {
        oss << " (system: " << err.system_id << ")";
    }
    return oss.str();
}

std::string format_body_error(const BodyError& err) {
    std::ostringstream oss;
    oss << "[BodyError] " << err.message;
    if (err.body_id != 0) {
        oss << " (body: " << err.body_id << ")";
    }
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty() && err.kind != ConfigError::Kind::FileNotFound) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, SystemError>) {
            oss << detail::format_system_error(err);
        } else if constexpr (std::is_same_v<T, BodyError>) {
            oss << detail::format_body_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::string, Error>;

} // namespace drape_core
