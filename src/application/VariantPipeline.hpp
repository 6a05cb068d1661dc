/**
 * @file VariantPipeline.hpp
 * @brief Runs the full generation flow for one target or a batch of targets.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/PathResolver.hpp"
#include "application/PromptBuilder.hpp"
#include "application/SequenceIndex.hpp"
#include "application/VariantValidator.hpp"
#include "domain/SequenceSource.hpp"
#include "domain/StateSpec.hpp"
#include "domain/VariantGenerator.hpp"
#include "infrastructure/ArchiveWriter.hpp"
#include "infrastructure/ContentCorpus.hpp"
#include "infrastructure/PipelineConfig.hpp"

namespace variantwalker::application {

struct TargetOutcome {
    domain::NodeAddress target;
    std::string contentKey;
    std::string targetFile;
    std::vector<std::string> accepted;
    std::string archivePath;
    bool reachedTarget = false;
};

struct BatchSummary {
    int ok = 0;
    int failed = 0;
};

/**
 * @class VariantPipeline
 * @brief Node lookup, path resolution, context, prompt, generation, validation,
 * optional append and archive, in that order.
 *
 * The sequence index is shared by all targets of a run. Accepted lines are only
 * appended in write mode and only after the whole batch of candidates was validated.
 */
class VariantPipeline {
public:
    VariantPipeline(const infrastructure::PipelineConfig& config,
                    std::shared_ptr<domain::SequenceSource> sequences,
                    std::shared_ptr<domain::VariantGenerator> generator);

    /**
     * @brief Processes one target. An archive record is written on success and failure.
     * @param state State specification; nullopt enters the target's own sequence.
     * @throws domain::StructuralError, domain::GenerationError (after archiving).
     */
    TargetOutcome processTarget(const domain::NodeAddress& target,
                                const std::optional<domain::StateSpec>& state,
                                bool writeMode);

    /** @brief Processes targets one at a time, honouring io.fail_fast. */
    BatchSummary runBatch(const std::vector<domain::NodeAddress>& targets,
                          const std::optional<domain::StateSpec>& state,
                          bool writeMode);

    SequenceIndex& index() { return m_index; }

private:
    infrastructure::PipelineConfig m_config;
    SequenceIndex m_index;
    infrastructure::ContentCorpus m_corpus;
    infrastructure::ArchiveWriter m_archive;
    std::shared_ptr<domain::VariantGenerator> m_generator;
    PathResolver m_resolver;
    PromptBuilder m_prompts;
    VariantValidator m_validator;
};

} // namespace variantwalker::application
