#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SampleInput {
    std::string name;
    // One entry per sieve; empty means the sieve was not measured.
    std::vector<std::optional<double>> values;
};

class SieveScale {
public:
    /**
     * @brief Builds the scale from opening sizes in millimeters.
     * @pre sizes are ordered coarse to fine.
     * @throws Granulo::ConfigurationException if fewer than 2 sizes are given,
     *         a size is non-positive or non-finite, or sizes are not strictly decreasing.
     */
    explicit SieveScale(std::vector<double> sizes);

    /**
     * @brief Indian Standard series used by default (53 mm down to 75 micron).
     */
    static SieveScale standard();

    size_t size() const { return sizes_.size(); }
    double at(size_t index) const;
    const std::vector<double>& sizes() const { return sizes_; }

    double maxSize() const { return sizes_.front(); }
    double minSize() const { return sizes_.back(); }

    /**
     * @brief Checks that the sample carries one value per sieve.
     * @throws Granulo::ValidationException on a count mismatch.
     */
    void validateSample(const SampleInput& sample) const;

private:
    std::vector<double> sizes_;
};
