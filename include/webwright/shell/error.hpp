/*
 * Error taxonomy - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace webwright {

enum class ErrorKind {
    None,
    DirectoryNotFound,
    InvalidEnvName,
    InvalidModeName,
    CommandTimeout,
    ProcessLaunchFailure,
    FileReferenceNotFound,
    FileReferenceUnreadable,
    ClipboardUnavailable,
    TranslationFailure
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

const char* to_string(ErrorKind kind);

} // namespace webwright
