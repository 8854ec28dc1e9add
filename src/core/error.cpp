/// @file error.cpp
/// @brief Error chain formatting and Result instantiations

#include <ember/core/error.hpp>
#include <ember/core/log.hpp>
#include <sstream>

namespace ember_core {

namespace {

/// Appends the kind tag, message and kind-specific fields of an error
struct KindFormatter {
    std::ostringstream& out;

    void operator()(const std::string& message) const { out << message; }

    void operator()(const HandleError& err) const {
        out << "[HandleError] " << err.message;
    }

    void operator()(const DeliveryError& err) const {
        out << "[DeliveryError] " << err.message;
        field("target", err.target);
        field("callback", err.callback);
    }

    void operator()(const ConfigError& err) const {
        out << "[ConfigError] " << err.message;
        field("key", err.key);
    }

    void field(const char* label, const std::string& value) const {
        if (!value.empty()) {
            out << " (" << label << ": " << value << ")";
        }
    }
};

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";
    std::visit(KindFormatter{oss}, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }
    return oss.str();
}

template class Result<void, Error>;
template class Result<LogConfig, Error>;

} // namespace ember_core
