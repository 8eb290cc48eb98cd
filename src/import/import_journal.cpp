#include "nl/import/import_journal.h"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "nl/binary_io.h"
#include "nl/error.h"
#include "nl/errors.h"
#include "nl/orchestrator/event_bus.h"
#include "nl/orchestrator/io_util.h"

namespace nl::import {

namespace {

constexpr std::array<uint8_t, 6> kStateMagic = {'N', 'L', 'S', 'T', 'R', 'M'};
constexpr const char* kStateFileName = ".state";

[[noreturn]] void ThrowCorrupted(std::string_view detail) {
  throw Error{ErrorDomain::IO, errors::io::kStateCorrupted,
              std::string(errors::msg::kStateCorrupted) + ": " + std::string(detail)};
}

void PublishSkipped(const std::filesystem::path& path, const std::exception& ex) {
  nl::orchestrator::Event event;
  event.category = nl::orchestrator::EventCategory::kDiagnostics;
  event.severity = nl::orchestrator::EventSeverity::kWarning;
  event.event_id = "import_state_skipped";
  event.message = ex.what();
  event.fields.emplace_back("path", PathToUtf8String(path),
                            nl::orchestrator::FieldPrivacy::kHash);
  nl::orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

std::vector<uint8_t> SerializeImportState(const ImportState& state) {
  BinaryWriter writer;
  writer.Bytes(kStateMagic);
  writer.U8(kImportStateVersion);
  writer.Bytes(state.import_id);
  writer.Bytes(state.file_id);
  writer.Bytes(state.fingerprint);
  writer.U8(state.metadata.file_type);
  writer.U64(state.total_size);
  writer.U32(state.chunk_size);
  writer.U32(state.total_chunks);
  writer.U32(state.committed_chunks);
  writer.U64(state.bytes_written);
  writer.U64(state.created_at_ms);
  writer.U64(state.updated_at_ms);
  writer.String(state.metadata.file_name);
  writer.String(state.metadata.mime_type);
  return writer.Take();
}

ImportState ParseImportState(std::span<const uint8_t> bytes) {
  BinaryReader reader(bytes, ErrorDomain::IO, errors::io::kStateCorrupted,
                      errors::msg::kStateCorrupted);
  auto magic = reader.Bytes(kStateMagic.size());
  if (!std::equal(magic.begin(), magic.end(), kStateMagic.begin())) {
    ThrowCorrupted("bad magic");
  }
  if (reader.U8() != kImportStateVersion) {
    ThrowCorrupted("unsupported version");
  }
  ImportState state;
  reader.Into(state.import_id);
  reader.Into(state.file_id);
  reader.Into(state.fingerprint);
  state.metadata.file_type = reader.U8();
  state.total_size = reader.U64();
  state.chunk_size = reader.U32();
  state.total_chunks = reader.U32();
  state.committed_chunks = reader.U32();
  state.bytes_written = reader.U64();
  state.created_at_ms = reader.U64();
  state.updated_at_ms = reader.U64();
  state.metadata.file_name = reader.String();
  state.metadata.mime_type = reader.String();
  if (!reader.AtEnd()) {
    ThrowCorrupted("trailing bytes");
  }

  if (state.chunk_size == 0) {
    ThrowCorrupted("zero chunk size");
  }
  const uint64_t expected_chunks =
      state.total_size / state.chunk_size + (state.total_size % state.chunk_size != 0 ? 1 : 0);
  if (expected_chunks != state.total_chunks || state.committed_chunks > state.total_chunks ||
      state.bytes_written > state.total_size) {
    ThrowCorrupted("inconsistent counters");
  }
  return state;
}

FileImportJournal::FileImportJournal(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kStatePersistFailed,
                std::string(errors::msg::kStatePersistFailed) + ": " + ec.message(), ec.value()};
  }
}

std::filesystem::path FileImportJournal::StatePath(const ImportId& import_id) const {
  return root_ / ToHex(import_id) / kStateFileName;
}

void FileImportJournal::Save(const ImportState& state) {
  const auto path = StatePath(state.import_id);
  try {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw Error{ErrorDomain::IO, 0, ec.message(), ec.value()};
    }
    const auto payload = SerializeImportState(state);
    nl::orchestrator::AtomicReplace(path, payload);
  } catch (const Error& err) {
    throw Error{ErrorDomain::IO, errors::io::kStatePersistFailed,
                std::string(errors::msg::kStatePersistFailed) + ": " + err.what(),
                err.native_code, Retryability::kRetryable, err.context};
  }
}

std::optional<ImportState> FileImportJournal::Load(const ImportId& import_id) {
  const auto path = StatePath(import_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const auto bytes = nl::orchestrator::ReadFileBytes(path);
  ImportState state = ParseImportState(bytes);
  if (state.import_id != import_id) {
    ThrowCorrupted("identifier does not match directory");
  }
  return state;
}

std::vector<ImportState> FileImportJournal::List() {
  std::vector<ImportState> states;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory()) {
      continue;
    }
    const auto id = ObjectIdFromHex(it->path().filename().string());
    if (!id) {
      continue;
    }
    try {
      if (auto state = Load(*id)) {
        states.push_back(std::move(*state));
      }
    } catch (const Error& err) {
      PublishSkipped(it->path(), err);
    }
  }
  std::sort(states.begin(), states.end(), [](const ImportState& a, const ImportState& b) {
    return a.created_at_ms < b.created_at_ms;
  });
  return states;
}

void FileImportJournal::Remove(const ImportId& import_id) {
  const auto path = StatePath(import_id);
  nl::orchestrator::SecureWipeFile(path);
  std::error_code ec;
  std::filesystem::remove_all(path.parent_path(), ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kStatePersistFailed,
                std::string(errors::msg::kStatePersistFailed) + ": " + ec.message(), ec.value()};
  }
}

}  // namespace nl::import
