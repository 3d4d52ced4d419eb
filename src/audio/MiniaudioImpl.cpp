// SPDX-License-Identifier: Apache-2.0

// The miniaudio implementation lives in this translation unit only.
// MicrophoneCapture includes <miniaudio.h> for the declarations.
#define MA_NO_ENCODING
#define MA_NO_DECODING
#define MA_NO_GENERATION
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
