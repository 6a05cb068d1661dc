#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdlib>

#include "application/StateSpecParser.hpp"
#include "application/TargetListParser.hpp"
#include "application/VariantPipeline.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GeneratorClient.hpp"
#include "infrastructure/HttplibTransport.hpp"
#include "infrastructure/SequenceRepositoryFs.hpp"

using namespace variantwalker;

namespace {

constexpr const char* kDefaultConfigPath = "tool/variants_config.yaml";

struct CliOptions {
    std::optional<std::string> sequenceId;
    std::optional<int> messageId;
    std::optional<std::string> listPath;
    std::optional<std::string> statePath;
    std::string configPath = kDefaultConfigPath;
    bool writeMode = false;
    bool help = false;
};

void PrintUsage() {
    std::cout <<
        "VariantWalker - generate alternative phrasings for dialogue nodes\n"
        "\n"
        "Usage:\n"
        "  variantwalker --sequence <id> --message <id> [options]\n"
        "  variantwalker --list targets.txt [options]\n"
        "\n"
        "Options:\n"
        "  --sequence <id>   Sequence id of the target node\n"
        "  --message <id>    Message id of the target node\n"
        "  --list <file>     File with one seq:msg target per line ('#' comments allowed)\n"
        "  --config <file>   Configuration file (default: " << kDefaultConfigPath << ")\n"
        "  --state <file>    State specification used to resolve the path to each target\n"
        "  --write           Append accepted variants to content files (otherwise dry-run)\n"
        "  --help            Show this help\n";
}

// Returns nullopt on malformed arguments.
std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--write") {
            options.writeMode = true;
        } else if (arg == "--sequence") {
            auto value = next();
            if (!value) return std::nullopt;
            options.sequenceId = *value;
        } else if (arg == "--message") {
            auto value = next();
            if (!value) return std::nullopt;
            char* end = nullptr;
            long id = std::strtol(value->c_str(), &end, 10);
            if (value->empty() || *end != '\0') return std::nullopt;
            options.messageId = static_cast<int>(id);
        } else if (arg == "--list") {
            auto value = next();
            if (!value) return std::nullopt;
            options.listPath = *value;
        } else if (arg == "--config") {
            auto value = next();
            if (!value) return std::nullopt;
            options.configPath = *value;
        } else if (arg == "--state") {
            auto value = next();
            if (!value) return std::nullopt;
            options.statePath = *value;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 2;
    }
    if (options->help) {
        PrintUsage();
        return 0;
    }
    bool singleTarget = options->sequenceId && options->messageId;
    if (!singleTarget && !options->listPath) {
        PrintUsage();
        return 2;
    }

    try {
        infrastructure::PipelineConfig config = infrastructure::ConfigLoader::Load(options->configPath);

        std::optional<domain::StateSpec> state;
        if (options->statePath) {
            state = application::StateSpecParser::FromValue(
                infrastructure::ConfigLoader::ReadValueFile(*options->statePath));
        }

        std::vector<domain::NodeAddress> targets;
        if (options->listPath) {
            targets = application::TargetListParser::ParseFile(*options->listPath);
        } else {
            targets.push_back(domain::NodeAddress{*options->sequenceId, *options->messageId});
        }
        if (targets.empty()) {
            std::cerr << "No targets provided." << std::endl;
            return 1;
        }

        auto sequences = std::make_shared<infrastructure::SequenceRepositoryFs>(config.io.assetsDir);
        auto generator = std::make_shared<infrastructure::GeneratorClient>(
            config, std::make_shared<infrastructure::HttplibTransport>());
        if (generator->isMock()) {
            std::cout << "[VariantWalker] Mock generation (provider.mock or io.dry_run is set)." << std::endl;
        }

        application::VariantPipeline pipeline(config, sequences, generator);
        application::BatchSummary summary = pipeline.runBatch(targets, state, options->writeMode);

        std::cout << "\nDone. ok=" << summary.ok << " fail=" << summary.failed << std::endl;
        return summary.failed > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "[VariantWalker] " << e.what() << std::endl;
        return 1;
    }
}
