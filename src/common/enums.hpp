#pragma once

namespace streakguard {

enum class EventKind {
    Trigger,
    ManualReset,
    Undo
};

enum class RuleKind {
    Lemma,
    Pattern
};

enum class VariantKind {
    Transliteration,
    Lookalike,
    Spaced,
    ZeroWidth,
    Diacritic,
    Multimodal
};

enum class MatchLayer {
    Lemma,
    Pattern
};

enum class ExclusionKind {
    Quote,
    Url,
    Command
};

} // namespace streakguard
