#include "../include/extractor.hpp"
#include <algorithm>
#include <regex>

CommandExtractor::CommandExtractor(std::string program, std::vector<std::string> args, ProcessRunner& runner)
    : program_(std::move(program)), args_(std::move(args)), runner_(runner) {}

bool CommandExtractor::probe() const {
    return have_executable(program_);
}

ExtractResult CommandExtractor::extract(const std::filesystem::path& car, const std::filesystem::path& out_dir) {
    std::vector<std::string> argv{program_};
    for (const auto& a : args_) argv.push_back(a == "{car}" ? std::filesystem::absolute(car).string() : a);
    auto r = runner_.run(argv, out_dir);
    return ExtractResult{r.ok(), r.exit_code, std::move(r.output)};
}

bool is_zero_length_signature(const std::string& output) {
    static const std::regex sig("ZeroLengthSectionAsEOF|zero length|null padding", std::regex::icase);
    return std::regex_search(output, sig);
}

ExtractorList default_extractors(ProcessRunner& runner, bool prefer_ipfs_car) {
    ExtractorList list;
    list.push_back(std::make_unique<CommandExtractor>("car-pad", std::vector<std::string>{"x", "-f", "{car}"}, runner));
    list.push_back(std::make_unique<CommandExtractor>("car", std::vector<std::string>{"x", "-f", "{car}"}, runner));
    list.push_back(std::make_unique<CommandExtractor>(
        "ipfs-car", std::vector<std::string>{"unpack", "{car}", "--output", "."}, runner));
    if (prefer_ipfs_car) {
        std::rotate(list.begin(), list.end() - 1, list.end());
    }
    return list;
}

ExtractorList available_extractors(ExtractorList all) {
    ExtractorList out;
    for (auto& e : all) {
        if (e->probe()) out.push_back(std::move(e));
    }
    return out;
}
