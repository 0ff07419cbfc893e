#include "detect/lemma_normalizer.hpp"

#include <QtGlobal>

#include "detect/text_utils.hpp"

namespace streakguard {

std::string IdentityNormalizer::normalize(const std::string &word,
                                          const std::string &languageHint) const
{
    Q_UNUSED(languageHint);
    return foldCase(word);
}

DictionaryNormalizer::DictionaryNormalizer(const std::map<std::string, std::string> &forms)
{
    for (const auto &pair : forms) {
        m_forms.emplace(foldCase(pair.first), foldCase(pair.second));
    }
}

std::string DictionaryNormalizer::normalize(const std::string &word,
                                            const std::string &languageHint) const
{
    Q_UNUSED(languageHint);
    const std::string folded = foldCase(word);
    auto it = m_forms.find(folded);
    if (it == m_forms.end()) {
        return folded;
    }
    return it->second;
}

} // namespace streakguard
