#pragma once

#include <glib.h>

#define WHISPERTRIGGER_ERROR (whispertrigger_error_quark())

enum WhisperTriggerError {
    WHISPERTRIGGER_ERROR_DEVICE,       // microphone unavailable or stream failed
    WHISPERTRIGGER_ERROR_MODEL,        // model not loaded, inference failed, out of memory
    WHISPERTRIGGER_ERROR_ACCELERATOR,  // GPU backend failed; caller may retry on CPU
    WHISPERTRIGGER_ERROR_CONFIG,       // malformed or conflicting settings
    WHISPERTRIGGER_ERROR_INJECTION,    // keystroke delivery failed
    WHISPERTRIGGER_ERROR_REWRITE,      // AI post-processing request failed
};

GQuark whispertrigger_error_quark(void);
