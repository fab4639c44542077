/**
 * Parameter model and binder
 *
 * Each pipeline step statically declares the parameters it accepts
 * (StepDescriptor). The binder overlays the caller's ParameterPool on the
 * declared defaults and yields the concrete argument set for one step.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gearpost {

/**
 * A parameter value: absent, a scalar or a pair of scalars
 *
 * Absent is a real value, not "unset": supplying it for a trigger
 * parameter disables the step.
 */
class ParamValue {
public:
    enum class Kind {
        ABSENT,
        SCALAR,
        PAIR
    };

    ParamValue() : kind_(Kind::ABSENT), first_(0.0), second_(0.0) {}

    static ParamValue Absent() { return ParamValue(); }
    static ParamValue Scalar(double value);
    static ParamValue Pair(double first, double second);

    /**
     * Parse "none", a number, or "a,b"
     * Throws PostProcessError(InvalidParameter) on malformed text.
     */
    static ParamValue Parse(const std::string& name, const std::string& text);

    Kind kind() const { return kind_; }
    bool is_absent() const { return kind_ == Kind::ABSENT; }
    bool is_present() const { return kind_ != Kind::ABSENT; }
    bool is_scalar() const { return kind_ == Kind::SCALAR; }
    bool is_pair() const { return kind_ == Kind::PAIR; }

    double scalar() const;
    std::pair<double, double> pair() const;

    std::string to_string() const;

    bool operator==(const ParamValue& other) const;
    bool operator!=(const ParamValue& other) const { return !(*this == other); }

private:
    Kind kind_;
    double first_;
    double second_;
};

/**
 * Caller-supplied parameter mapping, read-only during a run
 */
class ParameterPool {
public:
    ParameterPool() = default;

    ParameterPool& Set(const std::string& name, const ParamValue& value);
    ParameterPool& Set(const std::string& name, double value) {
        return Set(name, ParamValue::Scalar(value));
    }

    bool Contains(const std::string& name) const { return values_.count(name) > 0; }
    const ParamValue& Get(const std::string& name) const;

    /**
     * Copy of this pool with every entry of `overrides` replacing ours
     */
    ParameterPool Overlay(const ParameterPool& overrides) const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    std::map<std::string, ParamValue>::const_iterator begin() const { return values_.begin(); }
    std::map<std::string, ParamValue>::const_iterator end() const { return values_.end(); }

private:
    std::map<std::string, ParamValue> values_;
};

/**
 * Accepted value shape of a declared parameter
 */
enum class ParamType {
    LENGTH,          // scalar
    COUNT,           // integral scalar
    LENGTH_OR_PAIR   // scalar or (axial, radial) pair
};

/**
 * One declared parameter of a step
 */
struct ParamSpec {
    std::string name;
    ParamType type;
    std::optional<ParamValue> default_value;  // nullopt: no default

    static ParamSpec Optional(const std::string& name, ParamType type) {
        return ParamSpec{name, type, ParamValue::Absent()};
    }
    static ParamSpec Required(const std::string& name, ParamType type) {
        return ParamSpec{name, type, std::nullopt};
    }
};

/**
 * Static declaration of a pipeline step's inputs
 *
 * The step is triggered when any of `triggers` resolves to a present
 * value. The body is never a declared parameter.
 */
struct StepDescriptor {
    std::string name;
    std::vector<std::string> triggers;
    std::vector<ParamSpec> params;

    const ParamSpec* Find(const std::string& param) const;
};

/**
 * Concrete argument set for one step, produced by ParameterBinder
 */
class BoundParams {
public:
    BoundParams() : triggered_(false) {}
    BoundParams(std::string step, std::map<std::string, ParamValue> values, bool triggered);

    const std::string& step() const { return step_; }

    /**
     * True when at least one trigger parameter is present
     */
    bool triggered() const { return triggered_; }

    const ParamValue& Get(const std::string& name) const;
    bool Has(const std::string& name) const { return Get(name).is_present(); }

    std::optional<double> OptionalLength(const std::string& name) const;
    std::optional<int> OptionalCount(const std::string& name) const;

    /**
     * Present value of a parameter the step cannot work without
     * Throws PostProcessError(MissingParameter) when absent.
     */
    double RequireLength(const std::string& name) const;

    const std::map<std::string, ParamValue>& values() const { return values_; }

private:
    std::string step_;
    std::map<std::string, ParamValue> values_;
    bool triggered_;
};

/**
 * Binds a step's declared parameters against a pool
 *
 * Override-or-default per parameter. A parameter with no default and no
 * override is a MissingParameter error when the step is triggered; an
 * untriggered step binds it as absent. Value shapes are checked against
 * the declared ParamType. Nothing is cached between calls.
 */
class ParameterBinder {
public:
    static BoundParams Bind(const StepDescriptor& descriptor, const ParameterPool& pool);

private:
    static const ParamValue* Resolve(const ParamSpec& spec, const ParameterPool& pool);
    static void CheckShape(const std::string& step, const ParamSpec& spec,
                           const ParamValue& value);
};

} // namespace gearpost
