#include "image_io.hpp"
#include "quantizer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [image files...]\n"
              << "\n"
              << "Convert images to the 16-color Commodore 64 palette (320 pixels wide).\n"
              << "Without file arguments, every image with the chosen extension in --dir\n"
              << "is converted. Output files are named c64_<name>_<METHOD>.png.\n"
              << "\n"
              << "Options:\n"
              << "  --dir <path>       Directory to scan (default: .)\n"
              << "  --ext <ext>        Extension to scan for (default: .jpg)\n"
              << "  --method <name>    rgb|cie76|cie94|cie2000|all (default: all)\n"
              << "  --out <path>       Output directory (default: same as --dir)\n"
              << "  --help             Show this help message\n";
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return (char)std::tolower(ch); });
    return s;
}

static std::vector<fs::path> scan_directory(const fs::path& dir, const std::string& ext) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && lower(entry.path().extension().string()) == ext) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

/// Convert one source file with every metric; throws on failure
static void convert_file(const fs::path& input, const fs::path& out_dir,
                         const std::vector<Metric>& metrics) {
    std::string base = input.stem().string();
    std::cout << "Processing " << base << std::endl;

    PixelGrid source = load_image(input.string());
    std::vector<PixelGrid> outputs = convert_all(source, metrics);

    std::cout << "Saving" << std::endl;
    for (size_t i = 0; i < metrics.size(); i++) {
        fs::path out = out_dir / ("c64_" + base + "_" + metric_name(metrics[i]) + ".png");
        save_png(outputs[i], out.string());
    }
    std::cout << "Done." << std::endl;
}

int main(int argc, char* argv[]) {
    std::string dir = ".";
    std::string ext = ".jpg";
    std::string method = "all";
    std::string out_dir;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--dir" && i + 1 < argc) {
            dir = argv[++i];
        } else if (arg == "--ext" && i + 1 < argc) {
            ext = argv[++i];
        } else if (arg == "--method" && i + 1 < argc) {
            method = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg[0] != '-') {
            inputs.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ext = lower(ext);
    if (!ext.empty() && ext[0] != '.') {
        ext = "." + ext;
    }
    if (out_dir.empty()) {
        out_dir = dir;
    }

    std::vector<Metric> metrics;
    if (lower(method) == "all") {
        metrics.assign(ALL_METRICS.begin(), ALL_METRICS.end());
    } else {
        try {
            metrics.push_back(parse_metric(method));
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::vector<fs::path> files;
    if (!inputs.empty()) {
        files.assign(inputs.begin(), inputs.end());
    } else {
        try {
            files = scan_directory(dir, ext);
        } catch (const fs::filesystem_error& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    if (files.empty()) {
        std::cout << "No " << ext << " files found in " << dir << std::endl;
        return 0;
    }

    int failures = 0;
    for (const auto& file : files) {
        try {
            convert_file(file, out_dir, metrics);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << file.string() << ": " << e.what() << std::endl;
            failures++;
        }
        std::cout << "-----------------------------" << std::endl;
    }

    if (failures > 0) {
        std::cerr << failures << " of " << files.size() << " images failed" << std::endl;
        return 1;
    }
    return 0;
}
