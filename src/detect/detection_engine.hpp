#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"
#include "detect/exclusion_filter.hpp"
#include "detect/lemma_normalizer.hpp"
#include "detect/pattern_compiler.hpp"
#include "detect/trigger_registry.hpp"

namespace streakguard {

// DetectionEngine decides whether a message contains a trigger. The lemma layer
// runs first over word tokens of the original text; the pattern layer runs the
// enabled pattern rules in insertion order over the decomposed text. Candidates
// inside excluded spans are skipped. Detection never writes.
class DetectionEngine {
public:
    DetectionEngine(TriggerRegistry &registry,
                    PatternCompiler &compiler,
                    const LemmaNormalizer &normalizer,
                    const ExclusionFilter &exclusions);

    DetectionResult detect(ChatId chatId, const std::string &text, const DetectionMeta &meta);

    // Same decision against an explicit rules snapshot.
    DetectionResult detect(const ActiveRules &rules,
                           const QString &text,
                           const DetectionMeta &meta) const;

private:
    TriggerRegistry &m_registry;
    PatternCompiler &m_compiler;
    const LemmaNormalizer &m_normalizer;
    const ExclusionFilter &m_exclusions;
};

} // namespace streakguard
