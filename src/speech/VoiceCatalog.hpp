// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mindcast
{

/// @brief Maps a language code and a voice type (Male, Female, Neutral) to a provider voice id.
class VoiceCatalog
{
  public:
    /// @brief language code -> voice type -> voice id.
    using VoiceTable = std::map<std::string, std::map<std::string, std::string>, std::less<>>;

    VoiceCatalog();

    /// @brief Creates a catalog whose entries override the built-in defaults.
    explicit VoiceCatalog(const VoiceTable& overrides);

    /// @brief The built-in voices (en-US and es-ES).
    [[nodiscard]] static auto defaults() -> VoiceTable;

    /// @brief Resolves a voice id.
    ///
    /// Unknown languages fall back to en-US, unknown voice types to Neutral.
    [[nodiscard]] auto resolve(std::string_view languageCode, std::string_view voiceType) const -> std::string;

    [[nodiscard]] auto table() const noexcept -> const VoiceTable& { return _voices; }

  private:
    VoiceTable _voices;
};

} // namespace mindcast
