/**
 * Parameter model and binder implementation
 */

#include "parameters.h"
#include "errors.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace gearpost {

namespace {

double parse_number(const std::string& name, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        throw_invalid("", name, "'" + text + "' is not a number");
    } catch (const std::out_of_range&) {
        throw_invalid("", name, "'" + text + "' is out of range");
    }

    // Allow trailing blanks only
    for (size_t i = consumed; i < text.size(); i++) {
        if (text[i] != ' ' && text[i] != '\t') {
            throw_invalid("", name, "'" + text + "' is not a number");
        }
    }

    if (!std::isfinite(value)) {
        throw_invalid("", name, "value must be finite");
    }
    return value;
}

const char* type_name(ParamType type) {
    switch (type) {
        case ParamType::LENGTH:         return "length";
        case ParamType::COUNT:          return "count";
        case ParamType::LENGTH_OR_PAIR: return "length or (axial, radial) pair";
    }
    return "unknown";
}

} // namespace

// ----------------------------------------------------------------------------
// ParamValue
// ----------------------------------------------------------------------------

ParamValue ParamValue::Scalar(double value) {
    ParamValue v;
    v.kind_ = Kind::SCALAR;
    v.first_ = value;
    return v;
}

ParamValue ParamValue::Pair(double first, double second) {
    ParamValue v;
    v.kind_ = Kind::PAIR;
    v.first_ = first;
    v.second_ = second;
    return v;
}

ParamValue ParamValue::Parse(const std::string& name, const std::string& text) {
    if (text.empty() || text == "none" || text == "None") {
        return Absent();
    }

    size_t comma = text.find(',');
    if (comma == std::string::npos) {
        return Scalar(parse_number(name, text));
    }

    if (text.find(',', comma + 1) != std::string::npos) {
        throw_invalid("", name, "'" + text + "' has more than two components");
    }

    return Pair(parse_number(name, text.substr(0, comma)),
                parse_number(name, text.substr(comma + 1)));
}

double ParamValue::scalar() const {
    if (kind_ != Kind::SCALAR) {
        throw std::logic_error("ParamValue::scalar() on a non-scalar value");
    }
    return first_;
}

std::pair<double, double> ParamValue::pair() const {
    if (kind_ == Kind::SCALAR) {
        return {first_, first_};
    }
    if (kind_ != Kind::PAIR) {
        throw std::logic_error("ParamValue::pair() on an absent value");
    }
    return {first_, second_};
}

std::string ParamValue::to_string() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::ABSENT: oss << "none"; break;
        case Kind::SCALAR: oss << first_; break;
        case Kind::PAIR:   oss << first_ << "," << second_; break;
    }
    return oss.str();
}

bool ParamValue::operator==(const ParamValue& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::ABSENT: return true;
        case Kind::SCALAR: return first_ == other.first_;
        case Kind::PAIR:   return first_ == other.first_ && second_ == other.second_;
    }
    return false;
}

// ----------------------------------------------------------------------------
// ParameterPool
// ----------------------------------------------------------------------------

ParameterPool& ParameterPool::Set(const std::string& name, const ParamValue& value) {
    values_[name] = value;
    return *this;
}

const ParamValue& ParameterPool::Get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("parameter not in pool: " + name);
    }
    return it->second;
}

ParameterPool ParameterPool::Overlay(const ParameterPool& overrides) const {
    ParameterPool merged(*this);
    for (const auto& entry : overrides.values_) {
        merged.values_[entry.first] = entry.second;
    }
    return merged;
}

// ----------------------------------------------------------------------------
// StepDescriptor / BoundParams
// ----------------------------------------------------------------------------

const ParamSpec* StepDescriptor::Find(const std::string& param) const {
    for (const ParamSpec& spec : params) {
        if (spec.name == param) return &spec;
    }
    return nullptr;
}

BoundParams::BoundParams(std::string step, std::map<std::string, ParamValue> values, bool triggered)
    : step_(std::move(step))
    , values_(std::move(values))
    , triggered_(triggered)
{
}

const ParamValue& BoundParams::Get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::logic_error("step '" + step_ + "' does not declare parameter '" + name + "'");
    }
    return it->second;
}

std::optional<double> BoundParams::OptionalLength(const std::string& name) const {
    const ParamValue& value = Get(name);
    if (value.is_absent()) return std::nullopt;
    return value.scalar();
}

std::optional<int> BoundParams::OptionalCount(const std::string& name) const {
    const ParamValue& value = Get(name);
    if (value.is_absent()) return std::nullopt;
    return static_cast<int>(std::lround(value.scalar()));
}

double BoundParams::RequireLength(const std::string& name) const {
    std::optional<double> value = OptionalLength(name);
    if (!value) {
        throw_missing(step_, name);
    }
    return *value;
}

// ----------------------------------------------------------------------------
// ParameterBinder
// ----------------------------------------------------------------------------

const ParamValue* ParameterBinder::Resolve(const ParamSpec& spec, const ParameterPool& pool) {
    if (pool.Contains(spec.name)) {
        return &pool.Get(spec.name);
    }
    if (spec.default_value) {
        return &*spec.default_value;
    }
    return nullptr;
}

void ParameterBinder::CheckShape(const std::string& step, const ParamSpec& spec,
                                 const ParamValue& value) {
    if (value.is_absent()) return;

    switch (spec.type) {
        case ParamType::LENGTH:
            if (!value.is_scalar()) {
                throw_invalid(step, spec.name,
                              std::string("expected a ") + type_name(spec.type) + ", got a pair");
            }
            break;

        case ParamType::COUNT:
            if (!value.is_scalar()) {
                throw_invalid(step, spec.name,
                              std::string("expected a ") + type_name(spec.type) + ", got a pair");
            }
            if (value.scalar() != std::floor(value.scalar())) {
                throw_invalid(step, spec.name, "expected an integral count, got " + value.to_string());
            }
            if (value.scalar() < static_cast<double>(std::numeric_limits<int>::min()) ||
                value.scalar() > static_cast<double>(std::numeric_limits<int>::max())) {
                throw_invalid(step, spec.name, "count out of range: " + value.to_string());
            }
            break;

        case ParamType::LENGTH_OR_PAIR:
            break;
    }
}

BoundParams ParameterBinder::Bind(const StepDescriptor& descriptor, const ParameterPool& pool) {
    // Trigger state decides whether a missing required parameter is an error
    bool triggered = false;
    for (const std::string& trigger : descriptor.triggers) {
        const ParamSpec* spec = descriptor.Find(trigger);
        if (spec == nullptr) {
            throw std::logic_error("step '" + descriptor.name +
                                   "' lists undeclared trigger '" + trigger + "'");
        }
        const ParamValue* value = Resolve(*spec, pool);
        if (value != nullptr && value->is_present()) {
            triggered = true;
        }
    }

    std::map<std::string, ParamValue> bound;
    for (const ParamSpec& spec : descriptor.params) {
        const ParamValue* value = Resolve(spec, pool);

        if (value == nullptr) {
            if (triggered) {
                throw_missing(descriptor.name, spec.name);
            }
            bound[spec.name] = ParamValue::Absent();
            continue;
        }

        CheckShape(descriptor.name, spec, *value);
        bound[spec.name] = *value;
    }

    return BoundParams(descriptor.name, std::move(bound), triggered);
}

} // namespace gearpost
