#include "SieveScale.h"

#include "GranuloExceptions.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace {
std::string describeSize(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}
} // namespace

SieveScale::SieveScale(std::vector<double> sizes) : sizes_(std::move(sizes)) {
    if (sizes_.size() < 2) {
        throw Granulo::ConfigurationException("sieve scale needs at least 2 sizes, got " + std::to_string(sizes_.size()));
    }
    for (size_t i = 0; i < sizes_.size(); ++i) {
        const double value = sizes_[i];
        if (!std::isfinite(value) || value <= 0.0) {
            throw Granulo::ConfigurationException("sieve size at index " + std::to_string(i) +
                                                  " must be a positive number, got " + describeSize(value));
        }
        if (i > 0 && !(value < sizes_[i - 1])) {
            throw Granulo::ConfigurationException("sieve sizes must be strictly decreasing: " +
                                                  describeSize(sizes_[i - 1]) + " followed by " + describeSize(value));
        }
    }
}

SieveScale SieveScale::standard() {
    return SieveScale({53.0, 40.0, 20.0, 10.0, 4.75, 2.36, 1.18, 0.6, 0.3, 0.15, 0.075});
}

double SieveScale::at(size_t index) const {
    if (index >= sizes_.size()) {
        throw Granulo::ValidationException("sieve index " + std::to_string(index) + " is outside the scale of " +
                                           std::to_string(sizes_.size()) + " sizes");
    }
    return sizes_[index];
}

void SieveScale::validateSample(const SampleInput& sample) const {
    if (sample.values.size() != sizes_.size()) {
        throw Granulo::ValidationException("sample '" + sample.name + "' has " + std::to_string(sample.values.size()) +
                                           " values but the sieve scale has " + std::to_string(sizes_.size()) + " sizes");
    }
}
