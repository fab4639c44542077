/**
 * Post-processing errors
 *
 * Every failure inside the pipeline aborts the whole run. The kind tells
 * the caller whether it passed bad parameters or the kernel gave up.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace gearpost {

enum class ErrorKind {
    MissingParameter,   // required parameter not supplied
    InvalidParameter,   // value violates a documented constraint
    GeometryFailure     // kernel rejected or failed an operation
};

const char* to_string(ErrorKind kind);

class PostProcessError : public std::runtime_error {
public:
    PostProcessError(ErrorKind kind,
                     const std::string& step,
                     const std::string& subject,
                     const std::string& message);

    ErrorKind kind() const { return kind_; }

    /**
     * Step that raised the error (empty when raised outside a step)
     */
    const std::string& step() const { return step_; }

    /**
     * Parameter name or kernel operation the error is about
     */
    const std::string& subject() const { return subject_; }

    /**
     * Message without the kind/step/subject prefix
     */
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string step_;
    std::string subject_;
    std::string detail_;
};

// Shorthands used by the binder and the step routines
[[noreturn]] void throw_missing(const std::string& step, const std::string& param);
[[noreturn]] void throw_invalid(const std::string& step, const std::string& param,
                                const std::string& reason);
[[noreturn]] void throw_geometry(const std::string& step, const std::string& operation,
                                 const std::string& reason);

} // namespace gearpost
