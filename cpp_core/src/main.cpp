#include "config_loader.hpp"
#include "wheel_ocr.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

struct OutputOptions {
    std::string dir;
    std::string format = "text";
    bool visualize = false;
};

void saveResult(const std::string& result, const std::string& image_path, const OutputOptions& output) {
    const std::string extension = output.format == "json" ? ".json" : ".txt";
    std::filesystem::path out_path;

    if (output.dir.empty()) {
        out_path = std::filesystem::path(image_path).replace_extension(extension);
    } else {
        std::filesystem::create_directories(output.dir);
        out_path = std::filesystem::path(output.dir) /
                   std::filesystem::path(image_path).filename().replace_extension(extension);
    }

    std::ofstream ofs(out_path);
    if (ofs.is_open()) {
        ofs << result;
        std::cout << "Saved: " << out_path << std::endl;
    } else {
        std::cerr << "Failed to save: " << out_path << std::endl;
    }
}

bool isImageFile(const std::string& filepath) {
    std::string ext = std::filesystem::path(filepath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tiff");
}

std::vector<std::string> collectImages(const std::vector<std::string>& candidates) {
    std::vector<std::string> images;
    for (const auto& file : candidates) {
        if (!std::filesystem::exists(file)) {
            std::cerr << "File not found: " << file << std::endl;
        } else if (!isImageFile(file)) {
            std::cerr << "Not an image file: " << file << std::endl;
        } else {
            images.push_back(file);
        }
    }
    return images;
}

std::vector<std::string> listDirectory(const std::string& dir) {
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && isImageFile(entry.path().string())) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string formatRecognition(const ImageRecognition& rec, const std::string& format) {
    if (format == "json") return WheelOCR::FormatRecognitionJson(rec);
    if (format == "table") return WheelOCR::FormatRecognitionTable(rec);
    return WheelOCR::FormatRecognition(rec);
}

void processImages(const WheelOCR& ocr, const std::vector<std::string>& files, const OutputOptions& output) {
    std::cout << "\n=== Processing " << files.size() << " files ===" << std::endl;

    auto start = std::chrono::steady_clock::now();
    std::vector<ImageRecognition> results = ocr.RecognizeBatch(files);
    auto end = std::chrono::steady_clock::now();

    for (const auto& rec : results) {
        std::string report = formatRecognition(rec, output.format);
        std::cout << "\n" << report;
        saveResult(report, rec.image_path, output);
        if (output.visualize && rec.success) ocr.SaveVisualization(rec, output.dir);
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << "\nCompleted " << results.size() << " files in " << duration.count() << " ms" << std::endl;
}

int processMultiAngle(const WheelOCR& ocr, const std::vector<std::string>& files, const OutputOptions& output) {
    std::cout << "\n=== Fusing " << files.size() << " views of one wheel ===" << std::endl;

    std::vector<ImageRecognition> per_image;
    FusedResult fused = ocr.RecognizeMultiAngle(files, &per_image);

    std::string report = output.format == "json" ? WheelOCR::FormatFusionJson(fused, per_image)
                                                 : WheelOCR::FormatFusion(fused, per_image);
    std::cout << "\n" << report;
    saveResult(report, std::filesystem::path(files.front()).replace_filename("fusion").string(), output);
    if (output.visualize) {
        for (const auto& rec : per_image) {
            if (rec.success) ocr.SaveVisualization(rec, output.dir);
        }
    }
    return fused.success ? 0 : 1;
}

void showUsage(const char* program_name) {
    std::cout << "WheelOCR - Wheel hub code recognition\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [OPTIONS] <image_files...>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -o, --output DIR        Output directory for results\n";
    std::cout << "  -m, --models DIR        Models directory (default: ../../models)\n";
    std::cout << "  -C, --config FILE       YAML configuration (default: config.yaml)\n";
    std::cout << "  -c, --cuda              Enable CUDA acceleration\n";
    std::cout << "  -b, --batch DIR         Process every image in DIR\n";
    std::cout << "  -f, --fuse METHOD       Fuse the given images as views of one wheel\n";
    std::cout << "                          (voting | weighted | smart | merge)\n";
    std::cout << "  -a, --alternatives      Report fusion alternatives\n";
    std::cout << "  -F, --format FORMAT     Report format: text | json | table (default: text)\n";
    std::cout << "  -v, --visualize         Save <name>_result.jpg with boxes and text drawn\n";
    std::cout << "  -t, --threshold CONF    Minimum OCR confidence\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " hub1.jpg hub2.jpg              # Recognize each image\n";
    std::cout << "  " << program_name << " -o results/ -b photos/          # Whole directory, save to results/\n";
    std::cout << "  " << program_name << " -f voting -a left.jpg right.jpg # One wheel, several angles\n";
    std::cout << "  " << program_name << " -F json -v hub1.jpg            # JSON report plus annotated image\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        showUsage(argv[0]);
        return 1;
    }

    std::vector<std::string> input_files;
    OutputOptions output;
    std::string models_dir = "../../models";
    std::string config_path = "config.yaml";
    std::string batch_dir;
    std::string fusion_method;
    std::string threshold;
    bool use_cuda = false;
    bool alternatives = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            showUsage(argv[0]);
            return 0;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output.dir = argv[++i];
        } else if ((arg == "-m" || arg == "--models") && i + 1 < argc) {
            models_dir = argv[++i];
        } else if ((arg == "-C" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-b" || arg == "--batch") && i + 1 < argc) {
            batch_dir = argv[++i];
        } else if ((arg == "-f" || arg == "--fuse") && i + 1 < argc) {
            fusion_method = argv[++i];
        } else if ((arg == "-t" || arg == "--threshold") && i + 1 < argc) {
            threshold = argv[++i];
        } else if ((arg == "-F" || arg == "--format") && i + 1 < argc) {
            output.format = argv[++i];
        } else if (arg == "-v" || arg == "--visualize") {
            output.visualize = true;
        } else if (arg == "-a" || arg == "--alternatives") {
            alternatives = true;
        } else if (arg == "-c" || arg == "--cuda") {
            use_cuda = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        } else {
            input_files.push_back(arg);
        }
    }

    if (output.format != "text" && output.format != "json" && output.format != "table") {
        std::cerr << "Unsupported format: " << output.format << std::endl;
        return 1;
    }

    try {
        WheelConfig config = ConfigLoader::Load(config_path);
        if (use_cuda) config.system.use_gpu = true;
        if (!fusion_method.empty()) {
            if (!MultiSourceFusion::IsSupportedMethod(fusion_method)) {
                std::cerr << "Unsupported fusion method: " << fusion_method << std::endl;
                return 1;
            }
            config.multi_angle.fusion_method = fusion_method;
        }
        if (alternatives) config.multi_angle.return_alternatives = true;
        if (!threshold.empty()) config.postprocessing.min_confidence = std::stod(threshold);

        std::vector<std::string> files = batch_dir.empty() ? collectImages(input_files) : listDirectory(batch_dir);
        if (files.empty()) {
            std::cerr << "Error: No input images." << std::endl;
            showUsage(argv[0]);
            return 1;
        }

        std::cout << "Initializing WheelOCR..." << std::endl;
        WheelOCR ocr(models_dir, config);
        std::cout << "WheelOCR ready!" << std::endl;

        if (!fusion_method.empty()) return processMultiAngle(ocr, files, output);
        processImages(ocr, files, output);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
