// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// This file must be compiled exactly once. Other sources (the piper WAV writer)
// include <miniaudio.h> without the IMPLEMENTATION define.
#define MA_NO_DEVICE_IO
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
