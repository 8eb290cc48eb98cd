#pragma once

#include <string_view>

namespace nl::errors::msg {
// Centralized user-facing message catalog.
inline constexpr std::string_view kReaderClosed{"Reader is closed"};
inline constexpr std::string_view kOversizeRejected{"File exceeds the configured size ceiling"};
inline constexpr std::string_view kGeometryZeroChunks{"Non-empty file declares zero chunks"};
inline constexpr std::string_view kGeometryChunkTooLarge{"Resolved chunk size exceeds the windowed reader limit"};
inline constexpr std::string_view kChunkLoadTimeout{"Timed out loading chunk"};
inline constexpr std::string_view kChunkLoadFailed{"Failed to load chunk"};
inline constexpr std::string_view kChunkShorterThanGeometry{"Decrypted chunk shorter than its geometry range"};
inline constexpr std::string_view kPreloadTimeout{"Whole-file preload exceeded its time limit"};
inline constexpr std::string_view kPreloadSizeMismatch{"Preloaded payload does not match the declared size"};
inline constexpr std::string_view kImportFingerprintMismatch{"Source does not match the pending import"};
inline constexpr std::string_view kImportNotFound{"No pending import with that identifier"};
inline constexpr std::string_view kImportClosed{"Import session already finished or aborted"};
inline constexpr std::string_view kImportChunkWriteFailed{"Failed to seal import chunk"};
inline constexpr std::string_view kChunkOutOfOrder{"Chunk index does not follow the committed count"};
inline constexpr std::string_view kChunkLengthMismatch{"Chunk length does not match the import geometry"};
inline constexpr std::string_view kFinishBeforeComplete{"Import finished before every chunk was committed"};
inline constexpr std::string_view kStateCorrupted{"Import state file is corrupted"};
inline constexpr std::string_view kStatePersistFailed{"Failed to persist import state"};
inline constexpr std::string_view kSourceReadFailed{"Failed to read import source"};
inline constexpr std::string_view kChunkAuthenticationFailed{"Chunk authentication failed"};
inline constexpr std::string_view kChunkFileMissing{"Chunk file missing"};
inline constexpr std::string_view kManifestInvalid{"File manifest is invalid"};
inline constexpr std::string_view kFileNotFound{"No stored file with that identifier"};
inline constexpr std::string_view kSecureWipeFailed{"Secure wipe failed"};
}  // namespace nl::errors::msg
