#include "ParameterSpace.hpp"
#include "pipeline_tuner/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <unordered_set>

namespace {

constexpr double kUnitTolerance = 1e-9;
constexpr double kIntegralTolerance = 1e-9;
constexpr int kMaxPreimageUlps = 16;

bool isIntegral(double value) {
    return std::abs(value - std::round(value)) <= kIntegralTolerance;
}

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

}

namespace pipeline_tuner::space {

ParameterSpace::ParameterSpace(std::vector<ParameterSpec> specs)
    : specs_(std::move(specs)) {
    if (specs_.empty()) {
        throw std::runtime_error("Parameter space must contain at least one parameter");
    }

    std::unordered_set<std::string> names;
    for (const auto& spec : specs_) {
        if (spec.name.empty()) {
            throw std::runtime_error("Parameter name must not be empty");
        }
        if (spec.name.find_first_of("=;,") != std::string::npos) {
            throw std::runtime_error("Parameter name must not contain '=', ';' or ',': " + spec.name);
        }
        if (!names.insert(spec.name).second) {
            throw std::runtime_error("Duplicate parameter name: " + spec.name);
        }

        switch (spec.kind) {
            case ParameterKind::CONTINUOUS:
                if (!(spec.low < spec.high)) {
                    throw std::runtime_error("Parameter " + spec.name + ": low must be < high");
                }
                if (spec.step < 0.0) {
                    throw std::runtime_error("Parameter " + spec.name + ": step must be >= 0");
                }
                break;
            case ParameterKind::INTEGER:
                if (!(spec.low < spec.high)) {
                    throw std::runtime_error("Parameter " + spec.name + ": low must be < high");
                }
                if (!isIntegral(spec.low) || !isIntegral(spec.high)) {
                    throw std::runtime_error("Parameter " + spec.name + ": integer bounds must be integral");
                }
                break;
            case ParameterKind::CATEGORICAL: {
                if (spec.choices.size() < 2) {
                    throw std::runtime_error("Parameter " + spec.name + ": categorical needs at least 2 choices");
                }
                std::unordered_set<std::string> labels(spec.choices.begin(), spec.choices.end());
                if (labels.size() != spec.choices.size()) {
                    throw std::runtime_error("Parameter " + spec.name + ": categorical choices must be unique");
                }
                break;
            }
        }
    }
}

const ParameterSpec& ParameterSpace::spec(const std::string& name) const {
    for (const auto& s : specs_) {
        if (s.name == name) {
            return s;
        }
    }
    throw OutOfDomainError("unknown parameter '" + name + "'");
}

void ParameterSpace::validateValue(const ParameterSpec& spec, double value) const {
    if (!std::isfinite(value)) {
        throw OutOfDomainError(spec.name + " is not finite");
    }

    switch (spec.kind) {
        case ParameterKind::CONTINUOUS:
            if (value < spec.low || value > spec.high) {
                throw OutOfDomainError(spec.name + "=" + formatNumber(value) + " outside [" +
                                       formatNumber(spec.low) + ", " + formatNumber(spec.high) + "]");
            }
            break;
        case ParameterKind::INTEGER:
            if (!isIntegral(value)) {
                throw OutOfDomainError(spec.name + "=" + formatNumber(value) + " is not an integer");
            }
            if (value < spec.low || value > spec.high) {
                throw OutOfDomainError(spec.name + "=" + formatNumber(value) + " outside [" +
                                       formatNumber(spec.low) + ", " + formatNumber(spec.high) + "]");
            }
            break;
        case ParameterKind::CATEGORICAL: {
            const double last = static_cast<double>(spec.choices.size() - 1);
            if (!isIntegral(value) || value < 0.0 || value > last) {
                throw OutOfDomainError(spec.name + "=" + formatNumber(value) + " is not a valid choice index");
            }
            break;
        }
    }
}

void ParameterSpace::validate(const Configuration& configuration) const {
    for (const auto& [name, value] : configuration) {
        (void)value;
        spec(name);  // throws for unknown names
    }
    for (const auto& s : specs_) {
        auto it = configuration.find(s.name);
        if (it == configuration.end()) {
            throw OutOfDomainError("missing parameter '" + s.name + "'");
        }
        validateValue(s, it->second);
    }
}

bool ParameterSpace::contains(const Configuration& configuration) const {
    try {
        validate(configuration);
        return true;
    } catch (const OutOfDomainError&) {
        return false;
    }
}

double ParameterSpace::encodeValue(const ParameterSpec& spec, double value) const {
    if (spec.kind == ParameterKind::CATEGORICAL) {
        return std::round(value) / static_cast<double>(spec.choices.size() - 1);
    }
    if (spec.kind == ParameterKind::INTEGER) {
        return (std::round(value) - spec.low) / (spec.high - spec.low);
    }

    const double unit = (value - spec.low) / (spec.high - spec.low);
    if (decodeValue(spec, unit) == value) {
        return unit;
    }
    // The affine map loses a few ULPs; take the nearest unit coordinate that decodes back to value exactly.
    double below = unit;
    double above = unit;
    for (int i = 0; i < kMaxPreimageUlps; ++i) {
        above = std::nextafter(above, 1.0);
        if (decodeValue(spec, above) == value) {
            return above;
        }
        below = std::nextafter(below, 0.0);
        if (decodeValue(spec, below) == value) {
            return below;
        }
    }
    return unit;
}

double ParameterSpace::decodeValue(const ParameterSpec& spec, double unit) const {
    switch (spec.kind) {
        case ParameterKind::CATEGORICAL:
            return std::round(unit * static_cast<double>(spec.choices.size() - 1));
        case ParameterKind::INTEGER:
            return std::clamp(std::round(spec.low + unit * (spec.high - spec.low)), spec.low, spec.high);
        case ParameterKind::CONTINUOUS:
        default:
            return std::clamp(spec.low + unit * (spec.high - spec.low), spec.low, spec.high);
    }
}

std::vector<double> ParameterSpace::encode(const Configuration& configuration) const {
    validate(configuration);

    std::vector<double> vector;
    vector.reserve(specs_.size());
    for (const auto& s : specs_) {
        vector.push_back(encodeValue(s, configuration.at(s.name)));
    }
    return vector;
}

Configuration ParameterSpace::decode(const std::vector<double>& vector) const {
    if (vector.size() != specs_.size()) {
        throw OutOfDomainError("vector has dimension " + std::to_string(vector.size()) +
                               ", space has " + std::to_string(specs_.size()));
    }

    Configuration configuration;
    for (size_t i = 0; i < specs_.size(); ++i) {
        double u = vector[i];
        if (!std::isfinite(u) || u < -kUnitTolerance || u > 1.0 + kUnitTolerance) {
            throw OutOfDomainError("coordinate " + std::to_string(i) + " (" + specs_[i].name + ") = " +
                                   formatNumber(u) + " outside [0, 1]");
        }
        u = std::clamp(u, 0.0, 1.0);
        configuration[specs_[i].name] = decodeValue(specs_[i], u);
    }
    return configuration;
}

double ParameterSpace::quantizeValue(const ParameterSpec& spec, double value) const {
    switch (spec.kind) {
        case ParameterKind::CATEGORICAL:
            return std::clamp(std::round(value), 0.0, static_cast<double>(spec.choices.size() - 1));
        case ParameterKind::INTEGER:
            return std::clamp(std::round(value), spec.low, spec.high);
        case ParameterKind::CONTINUOUS:
        default:
            if (spec.step > 0.0) {
                const double k = std::round((value - spec.low) / spec.step);
                double snapped = spec.low + k * spec.step;
                // last grid point may overshoot when the range is not a multiple of step
                if (snapped > spec.high) {
                    snapped -= spec.step;
                }
                return std::clamp(snapped, spec.low, spec.high);
            }
            return std::clamp(value, spec.low, spec.high);
    }
}

Configuration ParameterSpace::quantize(const Configuration& configuration) const {
    Configuration result;
    for (const auto& s : specs_) {
        auto it = configuration.find(s.name);
        if (it == configuration.end()) {
            throw OutOfDomainError("missing parameter '" + s.name + "'");
        }
        result[s.name] = quantizeValue(s, it->second);
    }
    return result;
}

std::vector<double> ParameterSpace::snap(const std::vector<double>& vector) const {
    std::vector<double> clamped(vector.size());
    std::transform(vector.begin(), vector.end(), clamped.begin(),
                   [](double u) { return std::isfinite(u) ? std::clamp(u, 0.0, 1.0) : 0.5; });
    return encode(quantize(decode(clamped)));
}

Configuration ParameterSpace::defaults() const {
    Configuration configuration;
    for (const auto& s : specs_) {
        configuration[s.name] = s.default_value;
    }
    return configuration;
}

Configuration ParameterSpace::sampleUniform(std::mt19937& rng) const {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<double> vector(specs_.size());
    for (double& u : vector) {
        u = unit(rng);
    }
    return quantize(decode(vector));
}

std::vector<Configuration> ParameterSpace::sampleLatinHypercube(int n, std::mt19937& rng) const {
    std::vector<Configuration> design;
    if (n <= 0) {
        return design;
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<std::vector<double>> columns(specs_.size());
    for (auto& column : columns) {
        column.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            column.push_back((static_cast<double>(i) + unit(rng)) / static_cast<double>(n));
        }
        std::shuffle(column.begin(), column.end(), rng);
    }

    design.reserve(static_cast<size_t>(n));
    std::vector<double> vector(specs_.size());
    for (int i = 0; i < n; ++i) {
        for (size_t d = 0; d < specs_.size(); ++d) {
            vector[d] = columns[d][static_cast<size_t>(i)];
        }
        design.push_back(quantize(decode(vector)));
    }
    return design;
}

std::string ParameterSpace::signature() const {
    std::ostringstream oss;
    oss << std::setprecision(17);
    for (const auto& s : specs_) {
        oss << s.name << ":" << toString(s.kind);
        if (s.kind == ParameterKind::CATEGORICAL) {
            for (const auto& choice : s.choices) {
                oss << ":" << choice;
            }
        } else {
            oss << ":" << s.low << ":" << s.high;
        }
        oss << "|";
    }
    return oss.str();
}

std::string ParameterSpace::formatValue(const std::string& name, double value) const {
    const auto& s = spec(name);
    if (s.kind == ParameterKind::CATEGORICAL) {
        const auto index = static_cast<long>(std::llround(value));
        if (index >= 0 && index < static_cast<long>(s.choices.size())) {
            return s.choices[static_cast<size_t>(index)];
        }
    }
    if (s.kind == ParameterKind::INTEGER) {
        return std::to_string(std::llround(value));
    }
    return formatNumber(value);
}

std::string ParameterSpace::describe(const Configuration& configuration) const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& s : specs_) {
        auto it = configuration.find(s.name);
        if (it == configuration.end()) {
            continue;
        }
        if (!first) {
            oss << ", ";
        }
        oss << s.name << "=" << formatValue(s.name, it->second);
        first = false;
    }
    return oss.str();
}

} // namespace pipeline_tuner::space
