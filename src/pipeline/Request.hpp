// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>

namespace mindcast
{

enum class EmotionalState
{
    Happy,
    Sad,
    Anxious,
    Calm,
    Stressed,
    Tired,
    Energetic,
    Neutral,
};

enum class MeditationStyle
{
    Mindfulness,
    GuidedImagery,
    BodyScan,
    LovingKindness,
    BreathFocus,
    ProgressiveRelaxation,
};

enum class MeditationTheme
{
    StressRelief,
    Sleep,
    Focus,
    SelfCompassion,
    AnxietyRelief,
    Confidence,
    Gratitude,
};

enum class VoiceType
{
    Male,
    Female,
    Neutral,
};

enum class Soundscape
{
    Nature,
    Urban,
    Ambient,
    Silence,
    Rain,
    Ocean,
    Forest,
    Nighttime,
};

/// @brief Canonical spellings of the request enumerations, indexed by enumerator value.
template <typename E>
struct EnumNames;

template <>
struct EnumNames<EmotionalState>
{
    static constexpr auto What = std::string_view { "emotional state" };
    static constexpr auto Names = std::array<std::string_view, 8> {
        "happy", "sad", "anxious", "calm", "stressed", "tired", "energetic", "neutral",
    };
};

template <>
struct EnumNames<MeditationStyle>
{
    static constexpr auto What = std::string_view { "meditation style" };
    static constexpr auto Names = std::array<std::string_view, 6> {
        "Mindfulness", "GuidedImagery", "BodyScan", "LovingKindness", "BreathFocus", "ProgressiveRelaxation",
    };
};

template <>
struct EnumNames<MeditationTheme>
{
    static constexpr auto What = std::string_view { "meditation theme" };
    static constexpr auto Names = std::array<std::string_view, 7> {
        "StressRelief", "Sleep", "Focus", "SelfCompassion", "AnxietyRelief", "Confidence", "Gratitude",
    };
};

template <>
struct EnumNames<VoiceType>
{
    static constexpr auto What = std::string_view { "voice type" };
    static constexpr auto Names = std::array<std::string_view, 3> { "Male", "Female", "Neutral" };
};

template <>
struct EnumNames<Soundscape>
{
    static constexpr auto What = std::string_view { "soundscape" };
    static constexpr auto Names = std::array<std::string_view, 8> {
        "Nature", "Urban", "Ambient", "Silence", "Rain", "Ocean", "Forest", "Nighttime",
    };
};

/// @brief Returns the canonical name of a request enumerator.
template <typename E>
[[nodiscard]] constexpr auto enumName(E value) -> std::string_view
{
    return EnumNames<E>::Names[static_cast<std::size_t>(value)];
}

/// @brief Parses a request enumerator, ignoring case.
/// @return The enumerator, or InvalidArgument listing the accepted names.
template <typename E>
[[nodiscard]] auto parseEnum(std::string_view text) -> Result<E>
{
    auto const equalsIgnoringCase = [text](std::string_view name) {
        return std::ranges::equal(text, name, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
    };

    const auto& names = EnumNames<E>::Names;
    for (auto i = std::size_t { 0 }; i < names.size(); ++i)
    {
        if (equalsIgnoringCase(names[i]))
            return static_cast<E>(i);
    }

    auto accepted = std::string {};
    for (auto const name: names)
        accepted += accepted.empty() ? std::string(name) : std::format(", {}", name);
    return makeError(ErrorCode::InvalidArgument,
                     std::format("Unknown {} '{}' (expected one of: {})", EnumNames<E>::What, text, accepted));
}

/// @brief Immutable input parameters of one meditation run.
struct MeditationRequest
{
    EmotionalState emotionalState = EmotionalState::Anxious;
    MeditationStyle style = MeditationStyle::Mindfulness;
    MeditationTheme theme = MeditationTheme::StressRelief;
    int durationMinutes = 10;
    VoiceType voice = VoiceType::Female;
    std::string languageCode = "en-US";
    Soundscape soundscape = Soundscape::Nature;

    auto operator==(const MeditationRequest&) const -> bool = default;
};

/// @brief Longest meditation that can be requested, in minutes.
constexpr auto MaxDurationMinutes = 120;

/// @brief Checks the values that the enumerations cannot constrain.
[[nodiscard]] inline auto validate(const MeditationRequest& request) -> VoidResult
{
    if (request.durationMinutes < 1 || request.durationMinutes > MaxDurationMinutes)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Duration must be between 1 and {} minutes, got {}",
                                     MaxDurationMinutes,
                                     request.durationMinutes));
    if (request.languageCode.empty())
        return makeError(ErrorCode::InvalidArgument, "Language code must not be empty");
    return {};
}

} // namespace mindcast
