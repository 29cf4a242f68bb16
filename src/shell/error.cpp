/*
 * Error taxonomy - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/shell/error.hpp>

namespace webwright {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::DirectoryNotFound: return "DirectoryNotFound";
        case ErrorKind::InvalidEnvName: return "InvalidEnvName";
        case ErrorKind::InvalidModeName: return "InvalidModeName";
        case ErrorKind::CommandTimeout: return "CommandTimeout";
        case ErrorKind::ProcessLaunchFailure: return "ProcessLaunchFailure";
        case ErrorKind::FileReferenceNotFound: return "FileReferenceNotFound";
        case ErrorKind::FileReferenceUnreadable: return "FileReferenceUnreadable";
        case ErrorKind::ClipboardUnavailable: return "ClipboardUnavailable";
        case ErrorKind::TranslationFailure: return "TranslationFailure";
    }
    return "Unknown";
}

} // namespace webwright
