#pragma once

#include "PlotRenderer.h"
#include "GranuloExceptions.h"
#include "SieveScale.h"

#include <optional>
#include <string>
#include <vector>

namespace granulo_test {

// Six sieves from 50 mm down to 75 micron.
inline SieveScale exampleScale() {
    return SieveScale({50.0, 25.0, 10.0, 4.75, 2.0, 0.075});
}

inline SampleInput sample(const std::string& name, const std::vector<std::optional<double>>& values) {
    SampleInput s;
    s.name = name;
    s.values = values;
    return s;
}

inline SampleInput sampleA() {
    return sample("A", {100.0, 90.0, 70.0, 40.0, 10.0, 0.0});
}

// Records every layout and answers with a fixed payload instead of running gnuplot.
class FakeRasterizer : public PlotRasterizer {
public:
    RasterImage rasterize(const PlotLayout& layout) override {
        ++calls;
        layouts.push_back(layout);
        if (!failure.empty()) {
            throw Granulo::RenderException(failure);
        }
        RasterImage image;
        image.bytes = payload;
        image.mimeType = "image/png";
        image.width = 640;
        image.height = 480;
        return image;
    }

    std::vector<uint8_t> payload = {'a', 'b', 'c'};
    std::string failure;
    int calls = 0;
    std::vector<PlotLayout> layouts;
};

} // namespace granulo_test
