/**
 * @file VariantPipeline.cpp
 * @brief Implementation of VariantPipeline.
 */

#include "application/VariantPipeline.hpp"
#include "application/ContextWindowBuilder.hpp"
#include "application/StateSpecParser.hpp"
#include "domain/ContentKey.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <iostream>

namespace variantwalker::application {

using json = nlohmann::json;

VariantPipeline::VariantPipeline(const infrastructure::PipelineConfig& config,
                                 std::shared_ptr<domain::SequenceSource> sequences,
                                 std::shared_ptr<domain::VariantGenerator> generator)
    : m_config(config),
      m_index(std::move(sequences)),
      m_corpus(config.io.assetsDir),
      m_archive(config.io.archiveDir),
      m_generator(std::move(generator)),
      m_resolver(m_index),
      m_prompts(m_config),
      m_validator(ValidationRules::FromConfig(m_config)) {}

TargetOutcome VariantPipeline::processTarget(const domain::NodeAddress& target,
                                             const std::optional<domain::StateSpec>& state,
                                             bool writeMode) {
    TargetOutcome outcome;
    outcome.target = target;

    domain::ArchiveRecord record;
    record.timestamp = infrastructure::ArchiveWriter::IsoTimestamp(std::chrono::system_clock::now());
    record.sequenceId = target.sequenceId;
    record.messageId = target.messageId;
    record.writeMode = writeMode;
    record.config = m_config.toJson();

    try {
        const domain::DialogueNode* node = m_index.findNode(target);
        if (!node) {
            throw domain::StructuralError("Message " + std::to_string(target.messageId) +
                                          " not found in sequence " + target.sequenceId);
        }
        if (!node->hasContentKey()) {
            throw domain::StructuralError("Message " + target.toString() + " has no contentKey. Add one first.");
        }
        const std::string contentKey = *node->contentKey;
        record.contentKey = contentKey;
        outcome.contentKey = contentKey;
        if (!domain::ContentKey::Decode(contentKey).isValid()) {
            throw domain::StructuralError("Invalid contentKey format: " + contentKey);
        }
        record.targetFile = m_corpus.pathFor(contentKey);
        outcome.targetFile = record.targetFile;

        domain::StateSpec effective = state ? *state : StateSpecParser::DefaultFor(target.sequenceId);
        if (effective.entry.sequenceId.empty()) {
            effective.entry.sequenceId = target.sequenceId;
        }
        record.state = effective.toJson();

        domain::ResolvedPath path = m_resolver.resolve(effective, target);
        record.resolvedPath = path.toJson();
        record.reachedTarget = path.reachedTarget;
        outcome.reachedTarget = path.reachedTarget;
        if (m_config.io.verbose) {
            std::cout << "[VariantPipeline] Path:";
            for (const auto& step : path.nodes) std::cout << " " << step.address().toString();
            std::cout << (path.reachedTarget ? "" : " (fallback)") << std::endl;
        }

        ContextWindowBuilder contextBuilder(
            m_index, m_config.context.historyBubbles, m_config.context.turnExamples,
            [this](const std::string& key) {
                if (!domain::ContentKey::Decode(key).isValid()) return std::vector<std::string>{};
                return m_corpus.readVariants(key);
            });
        std::vector<domain::ContextTurn> turns = contextBuilder.build(path);
        record.context = json::array();
        for (const auto& turn : turns) record.context.push_back(turn.toJson());

        if (m_config.context.includeSiblingExemplars) {
            record.siblingExemplars = m_corpus.collectExemplars(contentKey, m_config.context.maxExemplars);
        }
        record.existingVariants = m_corpus.readVariants(contentKey);

        PromptInputs inputs;
        inputs.contentKey = contentKey;
        inputs.targetPath = record.targetFile;
        inputs.defaultText = node->text;
        inputs.context = turns;
        inputs.siblingExemplars = record.siblingExemplars;
        inputs.existingVariants = record.existingVariants;
        domain::GenerationPrompt prompt = m_prompts.build(inputs);
        record.prompt = prompt.toJson();

        domain::GenerationResult generated;
        try {
            generated = m_generator->generate(prompt);
        } catch (const domain::GenerationError& e) {
            record.request = e.request();
            throw;
        }
        record.request = generated.requestSent;
        record.response = generated.rawResponse;

        std::vector<Verdict> verdicts = m_validator.review(generated.variants, record.existingVariants);
        record.verdicts = json::array();
        for (const auto& verdict : verdicts) {
            record.verdicts.push_back(verdict.toJson());
            if (verdict.accepted) {
                outcome.accepted.push_back(verdict.candidate);
            } else if (m_config.io.verbose) {
                std::cout << "[VariantPipeline] Rejected (" << verdict.reason << "): " << verdict.candidate << std::endl;
            }
        }
        record.acceptedVariants = outcome.accepted;

        if (writeMode) {
            m_corpus.appendVariants(contentKey, outcome.accepted);
            std::cout << "   Appended " << outcome.accepted.size() << " line(s) to " << outcome.targetFile << std::endl;
        } else {
            std::cout << "   (dry-run) Would append to: " << outcome.targetFile << std::endl;
            for (const auto& line : outcome.accepted) {
                std::cout << "   + " << line << std::endl;
            }
        }

        outcome.archivePath = m_archive.write(record);
    } catch (const std::exception& e) {
        record.status = "failed";
        record.error = e.what();
        try {
            m_archive.write(record);
        } catch (const std::exception& archiveError) {
            std::cerr << "[VariantPipeline] Could not archive failed attempt: " << archiveError.what() << std::endl;
        }
        throw;
    }

    return outcome;
}

BatchSummary VariantPipeline::runBatch(const std::vector<domain::NodeAddress>& targets,
                                       const std::optional<domain::StateSpec>& state,
                                       bool writeMode) {
    BatchSummary summary;
    for (const auto& target : targets) {
        std::cout << "-> Processing " << target.toString() << std::endl;
        try {
            TargetOutcome outcome = processTarget(target, state, writeMode);
            ++summary.ok;
            std::cout << "   Accepted " << outcome.accepted.size() << " variant(s) for "
                      << outcome.contentKey << std::endl;
        } catch (const std::exception& e) {
            ++summary.failed;
            std::cerr << "[VariantPipeline] Failed " << target.toString() << ": " << e.what() << std::endl;
            if (m_config.io.failFast) {
                std::cerr << "[VariantPipeline] Fail-fast enabled; stopping batch." << std::endl;
                break;
            }
        }
    }
    return summary;
}

} // namespace variantwalker::application
