#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nl/common.h"
#include "nl/error.h"
#include "nl/errors.h"
#include "nl/import/import_journal.h"
#include "nl/import/import_source.h"
#include "nl/import/streaming_import.h"
#include "nl/orchestrator/event_bus.h"
#include "nl/orchestrator/io_util.h"
#include "nl/security/secure_buffer.h"
#include "nl/security/zeroizer.h"
#include "nl/storage/random_access_reader.h"
#include "nl/storage/reader_policy.h"
#include "nl/vault/local_chunk_store.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitData = 65;
constexpr int kExitIO = 74;

constexpr size_t kCatBlockSize = 256 * 1024;

void PrintUsage() {
  std::cerr << "noleak vault tool\n";
  std::cerr << "Usage:\n";
  std::cerr << "  nlvault [--key=<path>] import <store> <source> [--name=N] [--mime=M]\n";
  std::cerr << "  nlvault [--key=<path>] cat <store> <file-id> [offset [length]]\n";
  std::cerr << "  nlvault [--key=<path>] stat <store> <file-id>\n";
  std::cerr << "  nlvault [--key=<path>] pending <store>\n";
  std::cerr << "  nlvault [--key=<path>] abort <store> <import-id>\n";
  std::cerr << "  nlvault [--key=<path>] cleanup <store> <max-age-seconds>\n";
  std::cerr << "\nThe key file holds 32 raw bytes; NL_VAULT_KEY_FILE is used when --key is absent.\n";
}

std::string_view DomainPrefix(nl::ErrorDomain domain) {
  switch (domain) {
  case nl::ErrorDomain::Security:
    return "Security error";
  case nl::ErrorDomain::IO:
    return "I/O error";
  case nl::ErrorDomain::Crypto:
    return "Crypto error";
  case nl::ErrorDomain::Validation:
    return "Validation error";
  case nl::ErrorDomain::Config:
    return "Configuration error";
  case nl::ErrorDomain::Dependency:
    return "Dependency error";
  case nl::ErrorDomain::State:
    return "State error";
  case nl::ErrorDomain::Internal:
    return "Internal error";
  }
  return "Error";
}

std::string DescribeError(const nl::Error& err) {
  std::string detail(err.what());
  for (auto it = err.context.rbegin(); it != err.context.rend(); ++it) {
    detail.append("\n  while: ");
    detail.append(*it);
  }
  return detail;
}

void ReportError(const nl::Error& err) {
  const std::string detail = DescribeError(err);
  std::cerr << DomainPrefix(err.domain) << ": " << detail << '\n';

  nl::orchestrator::Event event;
  event.category = nl::orchestrator::EventCategory::kDiagnostics;
  event.severity = nl::orchestrator::EventSeverity::kError;
  event.event_id = "cli_error";
  event.message = detail;
  event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
  event.fields.emplace_back("code", std::to_string(err.code),
                            nl::orchestrator::FieldPrivacy::kPublic, true);
  if (err.native_code.has_value()) {
    event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                              nl::orchestrator::FieldPrivacy::kPublic, true);
  }
  nl::orchestrator::EventBus::Instance().Publish(event);
}

int ExitCodeFor(const nl::Error& err) {
  if (err.code == nl::errors::crypto::kChunkAuthenticationFailed ||
      err.code == nl::errors::validation::kImportFingerprintMismatch ||
      err.code == nl::errors::validation::kManifestInvalid ||
      err.code == nl::errors::io::kStateCorrupted) {
    return kExitData;
  }
  switch (err.domain) {
  case nl::ErrorDomain::Security:
  case nl::ErrorDomain::Crypto:
    return kExitData;
  case nl::ErrorDomain::Validation:
  case nl::ErrorDomain::Config:
    return kExitUsage;
  case nl::ErrorDomain::IO:
  case nl::ErrorDomain::Dependency:
  case nl::ErrorDomain::State:
  case nl::ErrorDomain::Internal:
  default:
    return kExitIO;
  }
}

std::optional<uint64_t> ParseUnsigned(std::string_view text) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<nl::ObjectId> ParseId(std::string_view text, std::string_view description) {
  auto id = nl::ObjectIdFromHex(text);
  if (!id) {
    std::cerr << "Validation error: " << description << " must be 32 hex characters." << std::endl;
  }
  return id;
}

// Loads the raw store key. The intermediate vector is wiped before return.
std::optional<std::array<uint8_t, nl::vault::kStoreKeySize>> LoadKey(
    const std::optional<std::filesystem::path>& flag_path) {
  std::optional<std::filesystem::path> path = flag_path;
  if (!path) {
    if (const char* env = std::getenv("NL_VAULT_KEY_FILE"); env && *env != '\0') {
      path = std::filesystem::path(env);
    }
  }
  if (!path) {
    std::cerr << "Configuration error: no key file (use --key or NL_VAULT_KEY_FILE)." << std::endl;
    return std::nullopt;
  }
  auto bytes = nl::orchestrator::ReadFileBytes(*path);
  if (bytes.size() != nl::vault::kStoreKeySize) {
    nl::security::Zeroizer::WipeVector(bytes);
    std::cerr << "Configuration error: key file must hold exactly " << nl::vault::kStoreKeySize
              << " bytes." << std::endl;
    return std::nullopt;
  }
  std::array<uint8_t, nl::vault::kStoreKeySize> key{};
  std::copy(bytes.begin(), bytes.end(), key.begin());
  nl::security::Zeroizer::WipeVector(bytes);
  return key;
}

struct Store {
  std::shared_ptr<nl::vault::LocalChunkStore> chunks;
  std::shared_ptr<nl::import::FileImportJournal> journal;
  std::unique_ptr<nl::import::StreamingImportPipeline> pipeline;
};

Store OpenStore(const std::filesystem::path& root, std::array<uint8_t, nl::vault::kStoreKeySize>& key) {
  nl::security::Zeroizer::ScopeWiper<uint8_t> key_guard(key.data(), key.size());
  Store store;
  store.chunks = std::make_shared<nl::vault::LocalChunkStore>(
      root, std::span<const uint8_t, nl::vault::kStoreKeySize>(key));
  store.journal = std::make_shared<nl::import::FileImportJournal>(store.chunks->JournalRoot());
  store.pipeline = std::make_unique<nl::import::StreamingImportPipeline>(
      store.chunks, store.journal, nl::import::ImportPolicyFromEnvironment());
  return store;
}

int HandleImport(Store& store, const std::filesystem::path& source_path,
                 nl::import::ImportMetadata metadata) {
  nl::import::FileImportSource source(source_path);
  if (metadata.file_name.empty()) {
    metadata.file_name = nl::PathToUtf8String(source_path.filename());
  }
  const auto sink = [](const nl::import::ImportEvent& event) {
    switch (event.kind) {
    case nl::import::ImportEvent::Kind::kProgress:
      std::cerr << "\rchunks " << event.progress.chunks_completed << "/"
                << event.progress.total_chunks << "  bytes " << event.progress.bytes_written
                << "/" << event.progress.total_bytes << std::flush;
      break;
    case nl::import::ImportEvent::Kind::kComplete:
      std::cerr << "\ncomplete" << std::endl;
      break;
    case nl::import::ImportEvent::Kind::kError:
      std::cerr << "\nimport stopped; pending state kept for resume" << std::endl;
      break;
    }
  };
  const nl::FileId file_id = store.pipeline->Import(source, metadata, sink);
  std::cout << nl::ToHex(file_id) << std::endl;
  return kExitOk;
}

int HandleCat(Store& store, const nl::FileId& file_id, uint64_t offset,
              std::optional<uint64_t> length) {
  const auto handle = store.chunks->Describe(file_id);
  auto reader = nl::storage::OpenReader(store.chunks, handle,
                                        nl::storage::ReaderPolicyFromEnvironment());
  const uint64_t end = length ? std::min(handle.total_size, offset + *length) : handle.total_size;
  nl::security::SecureBuffer<uint8_t> block(kCatBlockSize);
  uint64_t position = offset;
  while (position < end) {
    const auto want = static_cast<size_t>(std::min<uint64_t>(block.size(), end - position));
    const size_t got = reader->ReadAt(position, block.AsSpan().first(want));
    if (got == 0) {
      break;
    }
    std::cout.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(got));
    if (!std::cout) {
      reader->Close();
      std::cerr << "I/O error: write to stdout failed." << std::endl;
      return kExitIO;
    }
    position += got;
  }
  reader->Close();
  std::cout.flush();
  return kExitOk;
}

int HandleStat(Store& store, const nl::FileId& file_id) {
  const auto info = store.chunks->Info(file_id);
  std::cout << "file_id     " << nl::ToHex(info.file_id) << '\n';
  std::cout << "name        " << info.metadata.file_name << '\n';
  std::cout << "mime        " << info.metadata.mime_type << '\n';
  std::cout << "type        " << static_cast<int>(info.metadata.file_type) << '\n';
  std::cout << "size        " << info.total_size << '\n';
  std::cout << "chunks      " << info.chunk_count << '\n';
  std::cout << "chunk_size  " << info.chunk_size << std::endl;
  return kExitOk;
}

int HandlePending(Store& store) {
  for (const auto& state : store.pipeline->ListPending()) {
    std::cout << nl::ToHex(state.import_id) << "  " << state.committed_chunks << "/"
              << state.total_chunks << "  " << state.bytes_written << "/" << state.total_size
              << "  " << state.metadata.file_name << '\n';
  }
  std::cout.flush();
  return kExitOk;
}

int HandleAbort(Store& store, const nl::ImportId& import_id) {
  store.pipeline->Abort(import_id);
  return kExitOk;
}

int HandleCleanup(Store& store, uint64_t max_age_seconds) {
  const size_t removed = store.pipeline->CleanupOlderThan(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(max_age_seconds)));
  std::cout << removed << std::endl;
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    std::optional<std::filesystem::path> key_path;
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg.rfind("--key=", 0) == 0) {
        auto value = arg.substr(std::string_view("--key=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        key_path = std::filesystem::path(std::string(value));
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }
    if (argc - index < 2) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string_view cmd = argv[index++];
    const std::filesystem::path store_root(argv[index++]);
    std::vector<std::string_view> args(argv + index, argv + argc);

    auto key = LoadKey(key_path);
    if (!key) {
      return kExitUsage;
    }
    Store store = OpenStore(store_root, *key);

    if (cmd == "import") {
      std::optional<std::filesystem::path> source;
      nl::import::ImportMetadata metadata;
      for (auto arg : args) {
        if (arg.rfind("--name=", 0) == 0) {
          metadata.file_name = std::string(arg.substr(std::string_view("--name=").size()));
        } else if (arg.rfind("--mime=", 0) == 0) {
          metadata.mime_type = std::string(arg.substr(std::string_view("--mime=").size()));
        } else if (!source) {
          source = std::filesystem::path(std::string(arg));
        } else {
          PrintUsage();
          return kExitUsage;
        }
      }
      if (!source) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleImport(store, *source, std::move(metadata));
    }
    if (cmd == "cat") {
      if (args.empty() || args.size() > 3) {
        PrintUsage();
        return kExitUsage;
      }
      auto file_id = ParseId(args[0], "file id");
      if (!file_id) {
        return kExitUsage;
      }
      uint64_t offset = 0;
      std::optional<uint64_t> length;
      if (args.size() >= 2) {
        auto parsed = ParseUnsigned(args[1]);
        if (!parsed) {
          PrintUsage();
          return kExitUsage;
        }
        offset = *parsed;
      }
      if (args.size() == 3) {
        length = ParseUnsigned(args[2]);
        if (!length) {
          PrintUsage();
          return kExitUsage;
        }
      }
      return HandleCat(store, *file_id, offset, length);
    }
    if (cmd == "stat") {
      if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      auto file_id = ParseId(args[0], "file id");
      return file_id ? HandleStat(store, *file_id) : kExitUsage;
    }
    if (cmd == "pending") {
      if (!args.empty()) {
        PrintUsage();
        return kExitUsage;
      }
      return HandlePending(store);
    }
    if (cmd == "abort") {
      if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      auto import_id = ParseId(args[0], "import id");
      return import_id ? HandleAbort(store, *import_id) : kExitUsage;
    }
    if (cmd == "cleanup") {
      if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      auto seconds = ParseUnsigned(args[0]);
      if (!seconds) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleCleanup(store, *seconds);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const nl::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
