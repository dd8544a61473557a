// SPDX-License-Identifier: Apache-2.0
#include "VoiceCatalog.hpp"

#include <core/Log.hpp>

namespace mindcast
{

namespace
{

    constexpr auto FallbackLanguage = std::string_view { "en-US" };
    constexpr auto FallbackVoiceType = std::string_view { "Neutral" };

} // namespace

VoiceCatalog::VoiceCatalog(): _voices(defaults())
{
}

VoiceCatalog::VoiceCatalog(const VoiceTable& overrides): _voices(defaults())
{
    for (const auto& [language, voices]: overrides)
        for (const auto& [type, id]: voices)
            _voices[language][type] = id;
}

auto VoiceCatalog::defaults() -> VoiceTable
{
    return {
        { "en-US", { { "Male", "Matthew" }, { "Female", "Joanna" }, { "Neutral", "Ivy" } } },
        { "es-ES", { { "Male", "Andrés" }, { "Female", "Conchita" }, { "Neutral", "Mia" } } },
    };
}

auto VoiceCatalog::resolve(std::string_view languageCode, std::string_view voiceType) const -> std::string
{
    auto language = _voices.find(languageCode);
    if (language == _voices.end())
    {
        log::warning("No voices for language {}, using {}", languageCode, FallbackLanguage);
        language = _voices.find(FallbackLanguage);
    }

    const auto& voices = language->second;
    if (auto const voice = voices.find(std::string(voiceType)); voice != voices.end())
        return voice->second;

    log::warning("No {} voice for {}, using {}", voiceType, language->first, FallbackVoiceType);
    if (auto const voice = voices.find(std::string(FallbackVoiceType)); voice != voices.end())
        return voice->second;

    return voices.empty() ? std::string {} : voices.begin()->second;
}

} // namespace mindcast
