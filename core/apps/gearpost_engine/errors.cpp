/**
 * Post-processing errors implementation
 */

#include "errors.h"

namespace gearpost {

namespace {

std::string format_message(ErrorKind kind,
                           const std::string& step,
                           const std::string& subject,
                           const std::string& message)
{
    std::string text = to_string(kind);
    if (!step.empty()) {
        text += " in step '" + step + "'";
    }
    if (!subject.empty()) {
        text += " (" + subject + ")";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingParameter: return "MissingParameter";
        case ErrorKind::InvalidParameter: return "InvalidParameter";
        case ErrorKind::GeometryFailure:  return "GeometryFailure";
    }
    return "Unknown";
}

PostProcessError::PostProcessError(ErrorKind kind,
                                   const std::string& step,
                                   const std::string& subject,
                                   const std::string& message)
    : std::runtime_error(format_message(kind, step, subject, message))
    , kind_(kind)
    , step_(step)
    , subject_(subject)
    , detail_(message)
{
}

void throw_missing(const std::string& step, const std::string& param) {
    throw PostProcessError(ErrorKind::MissingParameter, step, param,
                           "parameter is required but was not supplied");
}

void throw_invalid(const std::string& step, const std::string& param,
                   const std::string& reason) {
    throw PostProcessError(ErrorKind::InvalidParameter, step, param, reason);
}

void throw_geometry(const std::string& step, const std::string& operation,
                    const std::string& reason) {
    throw PostProcessError(ErrorKind::GeometryFailure, step, operation, reason);
}

} // namespace gearpost
