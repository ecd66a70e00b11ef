#include "quantizer.hpp"
#include "block_average.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <string>

TargetSize target_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw DegenerateBlockError("Empty source image " + std::to_string(width) +
                                   "x" + std::to_string(height));
    }
    double aspect_ratio = (double)width / height;
    double target_h = std::ceil(C64_WIDTH / aspect_ratio);
    if (target_h > MAX_TARGET_HEIGHT) {
        throw DegenerateBlockError("Source image " + std::to_string(width) + "x" +
                                   std::to_string(height) + " is too tall: output would be " +
                                   std::to_string(C64_WIDTH) + "x" + std::to_string((long long)target_h));
    }
    return {C64_WIDTH, (int)target_h};
}

PixelGrid convert_image(const PixelGrid& source, Metric metric, const Palette& palette) {
    TargetSize target = target_size(source.width(), source.height());
    int columns = target.width / 2;

    // Integer block size; the right/bottom remainder of the source is not sampled
    int block_w = std::max(1, source.width() / columns);
    int block_h = std::max(1, source.height() / target.height);

    PixelGrid output(target.width, target.height);

    for (int j = 0; j < target.height; j++) {
        for (int i = 0; i < columns; i++) {
            Rect block{i * block_w, j * block_h, (i + 1) * block_w, (j + 1) * block_h};
            BlockColor estimate = average_block(
                source, clamp_rect(block, source.width(), source.height()));
            const Rgba& c = palette.rgb(palette.closest(estimate, metric));
            output.set(i * 2, j, c);
            output.set(i * 2 + 1, j, c);
        }
    }

    return output;
}

std::vector<PixelGrid> convert_all(const PixelGrid& source,
                                   const std::vector<Metric>& metrics,
                                   const Palette& palette) {
    std::vector<std::future<PixelGrid>> tasks;
    tasks.reserve(metrics.size());
    for (Metric m : metrics) {
        tasks.push_back(std::async(std::launch::async, [&source, &palette, m]() {
            return convert_image(source, m, palette);
        }));
    }

    std::vector<PixelGrid> results;
    results.reserve(tasks.size());
    std::exception_ptr first_error;
    for (auto& task : tasks) {
        try {
            results.push_back(task.get());
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}
