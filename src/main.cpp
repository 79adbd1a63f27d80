#include "segmenter.hpp"
#include "constants.hpp"
#include "json_record.hpp"
#include <cstdint>
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <chrono>
#include <omp.h>
#include <iomanip>

struct Args {
    std::string input_path;
    std::string output_path;
    std::string abbrev_path;
    int limit = -1;
    bool threads_set = false;
    int threads = 4;
    bool whole = false;
    bool trace = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--abbrev" && i + 1 < argc) {
            args.abbrev_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            args.limit = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = std::stoi(argv[++i]);
            args.threads_set = true;
        } else if (arg == "--whole") {
            args.whole = true;
        } else if (arg == "--trace") {
            args.trace = true;
        } else {
            std::cerr << "Warning: ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

int main(int argc, char* argv[]) {
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(NULL);

    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (args.input_path.empty()) {
        std::cerr << "Usage: " << argv[0] << " --input <file> [--output <file>] [--abbrev <file>]"
                  << " [--limit <n>] [--threads <n>] [--whole] [--trace]" << std::endl;
        return 1;
    }

    if (args.threads_set) {
        omp_set_num_threads(args.threads);
    }

    // 1. Build the engine
    razdel::SegmenterConfig config;
    if (!args.abbrev_path.empty()) {
        config.abbreviations_path = args.abbrev_path;
    }
    razdel::SentenceSegmenter segmenter(config);
    std::cout << "Rules: " << segmenter.rules().size()
              << ", abbreviations: " << segmenter.lexicon().abbreviation_count() << std::endl;

    // 2. Read Input
    std::vector<std::string> texts;
    {
        std::ifstream infile(args.input_path);
        if (!infile.is_open()) {
            std::cerr << "Error opening input file: " << args.input_path << std::endl;
            return 1;
        }
        if (args.whole) {
            std::string content((std::istreambuf_iterator<char>(infile)),
                                std::istreambuf_iterator<char>());
            texts.push_back(std::move(content));
        } else {
            std::string line;
            while (std::getline(infile, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.empty()) continue;
                texts.push_back(line);
                if (args.limit > 0 && texts.size() >= static_cast<size_t>(args.limit)) break;
            }
        }
    }
    std::cout << "Loaded " << texts.size() << " texts." << std::endl;

    // 3. Process
    std::vector<std::string> results(texts.size());

    auto start_proc = std::chrono::high_resolution_clock::now();

    #pragma omp parallel for schedule(dynamic, 100)
    for (int64_t i = 0; i < static_cast<int64_t>(texts.size()); ++i) {
        const std::string& text = texts[i];
        auto boundaries = segmenter.find_sentence_boundaries(text);
        auto sentences = razdel::split_by_boundaries(razdel::decode_utf8(text), boundaries);
        double score = segmenter.get_quality_score(text, boundaries);
        if (args.trace) {
            auto candidates = segmenter.trace_candidates(text);
            results[i] = razdel::build_json_record(static_cast<size_t>(i), text, boundaries, sentences, score, &candidates);
        } else {
            results[i] = razdel::build_json_record(static_cast<size_t>(i), text, boundaries, sentences, score, nullptr);
        }
    }

    auto end_proc = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double>(end_proc - start_proc).count();

    std::cout << "Processed " << texts.size() << " texts in " << duration << "s" << std::endl;
    if (duration > 0.0) {
        std::cout << "Speed: " << (texts.size() / duration) << " texts/sec" << std::endl;
    }

    // 4. Output
    if (!args.output_path.empty()) {
        std::ofstream outfile(args.output_path);
        if (!outfile.is_open()) {
            std::cerr << "Error opening output file: " << args.output_path << std::endl;
            return 1;
        }
        for (const auto& res : results) {
            outfile << res << "\n";
        }
        std::cout << "Done. Saved to " << args.output_path << std::endl;
    } else {
        for (const auto& res : results) {
            std::cout << res << "\n";
        }
    }

    return 0;
}
