// main.cpp
#include <getopt.h>
#include <chrono>                     // latency
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "recognizer.hpp"
#include "report.hpp"

using json = nlohmann::json;

static bool quiet = false;

static void help() {
    std::cout << "usage: captcha_ocr [options] image [image ...]\n\n"
              << " -c | --config=file         | JSON config file\n"
              << " -r | --recognizer=name     | segmentation or whole_image (default: whole_image)\n"
              << " -m | --model=path          | ONNX model for the selected recognizer\n"
              << " -t | --threads=n           | intra-op threads for ONNX Runtime\n"
              << " -g | --cuda                | run the model with the CUDA execution provider\n"
              << " -q | --quiet               | only log errors\n"
              << " -h | --help                | show this help message\n";
}

static std::vector<unsigned char> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string recognizer_name;
    std::string model_path;
    int threads = -1;
    bool cuda = false;

    while (true) {
        int option_index = 0;
        static struct option long_options[] = {{"config", required_argument, nullptr, 'c'},
                                               {"recognizer", required_argument, nullptr, 'r'},
                                               {"model", required_argument, nullptr, 'm'},
                                               {"threads", required_argument, nullptr, 't'},
                                               {"cuda", no_argument, nullptr, 'g'},
                                               {"quiet", no_argument, nullptr, 'q'},
                                               {"help", no_argument, nullptr, 'h'},
                                               {nullptr, 0, nullptr, 0}};

        int c = getopt_long(argc, argv, "c:r:m:t:gqh", long_options, &option_index);
        if (c == -1)
            break;

        switch (c) {
            case 'c': config_path = optarg; break;
            case 'r': recognizer_name = optarg; break;
            case 'm': model_path = optarg; break;
            case 't':
                try {
                    threads = parse_thread_count(optarg);
                } catch (const ConfigError& e) {
                    std::cerr << "[MAIN] " << e.what() << std::endl;
                    return 2;
                }
                break;
            case 'g': cuda = true; break;
            case 'q': quiet = true; break;
            case 'h': help(); return 0;
            default: help(); return 2;
        }
    }

    if (optind >= argc) {
        help();
        return 2;
    }

    std::unique_ptr<Recognizer> recognizer;
    try {
        CaptchaConfig config = config_path.empty() ? CaptchaConfig() : load_config(config_path);
        if (!recognizer_name.empty()) config.recognizer = recognizer_name;
        if (!model_path.empty()) {
            if (config.recognizer == "segmentation")
                config.segmentation_model = model_path;
            else
                config.whole_image_model = model_path;
        }
        if (threads >= 0) config.session.intra_op_threads = threads;
        if (cuda) config.session.use_cuda = true;

        recognizer = make_recognizer(config);
    } catch (const CaptchaError& e) {
        std::cerr << "[MAIN] " << e.what() << std::endl;
        return 2;
    }
    if (!quiet) std::cerr << "[MAIN] " << recognizer->name() << " recognizer ready." << std::endl;

    json results = json::array();
    bool all_ok = true;

    for (int i = optind; i < argc; ++i) {
        const std::string file = argv[i];
        try {
            std::vector<unsigned char> bytes = read_file(file);

            auto t1 = std::chrono::high_resolution_clock::now();
            std::string captcha = recognizer->recognize(bytes);
            auto t2 = std::chrono::high_resolution_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();

            if (!quiet) std::cerr << "[MAIN] " << file << ": " << captcha << " (" << ms << " ms)" << std::endl;
            results.push_back(result_entry(file, recognizer->name(), captcha, ms));
        } catch (const std::exception& e) {
            std::cerr << "[MAIN] " << file << ": " << e.what() << std::endl;
            results.push_back(error_entry(file, e.what()));
            all_ok = false;
        }
    }

    std::cout << dump_report(results) << std::endl;
    return all_ok ? 0 : 1;
}
