// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace mindcast
{

/// @brief Configuration for LLM token sampling.
struct SamplerConfig
{
    float temperature = 0.7f;
    float topP = 0.9f;
    int topK = 40;
    int seed = -1; // -1 means random
    int maxTokens = 4096;
};

} // namespace mindcast
