#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "pv/common.h"
#include "pv/config/job_config.h"
#include "pv/core/cancellation.h"
#include "pv/crypto/random.h"
#include "pv/engine/package_engine.h"
#include "pv/error.h"
#include "pv/log/event_bus.h"
#include "pv/metadata/journal_store.h"
#include "pv/security/zeroizer.h"
#include "pv/storage/blob_store.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitData = 65;
  constexpr int kExitIO = 74;
  constexpr int kExitAuth = 77;
  constexpr int kExitCancelled = 130;

  constexpr std::string_view kJournalName = "metadata.journal";
  constexpr std::string_view kKeySaltName = "keysalt";
  constexpr std::string_view kBlobDirName = "packages";

  std::atomic<pv::core::CancellationToken*> g_cancel{nullptr};

  extern "C" void HandleInterrupt(int) {
    if (auto* token = g_cancel.load(std::memory_order_acquire)) {
      token->Cancel();
    }
  }

  void PrintUsage() {
    std::cerr << "PackVault package store\n";
    std::cerr << "Usage:\n";
    std::cerr << "  pvpack --repo=<dir> ingest <file>...\n";
    std::cerr << "  pvpack --repo=<dir> restore <key> <output>\n";
    std::cerr << "  pvpack --repo=<dir> list\n";
    std::cerr << "  pvpack --repo=<dir> verify [key]\n";
    std::cerr << "  pvpack --repo=<dir> packages\n";
    std::cerr << "  pvpack --repo=<dir> delete <key> [--keep-space]\n";
    std::cerr << "  pvpack --repo=<dir> compact <package>\n";
    std::cerr << "  pvpack --repo=<dir> restore-package <package> <dir> [skip|overwrite|rename]\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --key-hex=<64 hex>   Master key (otherwise PV_PASSPHRASE is used)\n";
    std::cerr << "  --log=<path>         Write JSON event log to file (default stderr)\n";
    std::cerr << "  --verbose            Log informational events\n";
    std::cerr << "\nEnvironment: PV_HASH, PV_CIPHER, PV_COMPRESSION, PV_CHUNK_MIN, PV_CHUNK_AVG,\n"
                 "PV_CHUNK_MAX, PV_PACKAGE_CEILING, PV_ENCODE_THREADS, PV_PASSPHRASE\n";
  }

  std::string_view DomainPrefix(pv::ErrorDomain domain) {
    switch (domain) {
    case pv::ErrorDomain::IO:
      return "I/O error";
    case pv::ErrorDomain::Integrity:
      return "Integrity error";
    case pv::ErrorDomain::Cancelled:
      return "Cancelled";
    case pv::ErrorDomain::Conflict:
      return "Conflict";
    case pv::ErrorDomain::Crypto:
      return "Crypto error";
    case pv::ErrorDomain::Validation:
      return "Validation error";
    case pv::ErrorDomain::Config:
      return "Configuration error";
    case pv::ErrorDomain::State:
      return "State error";
    case pv::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  int ExitCodeFor(const pv::Error& err) {
    switch (err.domain) {
    case pv::ErrorDomain::Integrity:
      return kExitData;
    case pv::ErrorDomain::Crypto:
      return kExitAuth;
    case pv::ErrorDomain::Validation:
    case pv::ErrorDomain::Config:
      return kExitUsage;
    case pv::ErrorDomain::Cancelled:
      return kExitCancelled;
    case pv::ErrorDomain::IO:
    case pv::ErrorDomain::Conflict:
    case pv::ErrorDomain::State:
    case pv::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  void ReportError(pv::log::EventBus& bus, const pv::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
    for (const auto& frame : err.context) {
      std::cerr << "  in " << frame << '\n';
    }

    pv::log::Event event;
    event.category = pv::log::EventCategory::kDiagnostics;
    event.severity = pv::log::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", pv::ErrorDomainName(err.domain));
    event.fields.emplace_back("code", std::to_string(err.code), pv::log::FieldPrivacy::kPublic,
                              true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                pv::log::FieldPrivacy::kPublic, true);
    }
    try {
      bus.Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  // Reads the repository's passphrase salt, creating it on first use.
  std::vector<uint8_t> LoadOrCreateKeySalt(const std::filesystem::path& repo) {
    const auto path = repo / kKeySaltName;
    std::vector<uint8_t> salt(pv::config::kPassphraseSaltSize);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      std::ifstream in(path, std::ios::binary);
      in.read(reinterpret_cast<char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
      if (static_cast<size_t>(in.gcount()) != salt.size()) {
        throw pv::IoError(pv::errors::io::kSourceReadFailed,
                          "key salt is truncated: " + pv::PathToUtf8String(path));
      }
      return salt;
    }
    pv::crypto::SystemRandomBytes(salt);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    out.flush();
    if (!out) {
      throw pv::IoError(pv::errors::io::kOutputWriteFailed,
                        "cannot write key salt: " + pv::PathToUtf8String(path));
    }
    return salt;
  }

  pv::config::JobConfig BuildJobConfig(const std::filesystem::path& repo,
                                       const std::optional<std::string>& key_hex) {
    pv::config::JobConfigBuilder builder;
    pv::config::ApplyEnvironmentOverrides(builder);
    if (key_hex) {
      builder.SetKeyHex(*key_hex);
    } else if (const char* passphrase = std::getenv("PV_PASSPHRASE");
               passphrase != nullptr && *passphrase != '\0') {
      builder.SetPassphrase(passphrase, LoadOrCreateKeySalt(repo));
    }
    return builder.Build();
  }

  int HandleIngest(pv::engine::PackageEngine& engine, const std::vector<std::string>& files,
                   const pv::core::CancellationToken& cancel) {
    std::vector<std::filesystem::path> paths(files.begin(), files.end());
    const auto results = engine.ProcessFiles(paths, cancel);
    int exit_code = kExitOk;
    for (const auto& result : results) {
      if (result.ok()) {
        std::cout << (result.fileset->is_shadow ? "shadow " : "stored ") << result.fileset->key
                  << ' ' << result.fileset->hash << '\n';
        continue;
      }
      std::cerr << "failed " << pv::PathToUtf8String(result.path) << ": " << result.message
                << '\n';
      try {
        std::rethrow_exception(result.error);
      } catch (const pv::Error& err) {
        exit_code = std::max(exit_code, ExitCodeFor(err));
      } catch (const std::exception&) {
        exit_code = std::max(exit_code, kExitIO);
      }
    }
    return exit_code;
  }

  int HandleRestore(pv::engine::PackageEngine& engine, const std::string& key,
                    const std::filesystem::path& output) {
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw pv::IoError(pv::errors::io::kOutputWriteFailed,
                        "cannot open output " + pv::PathToUtf8String(output));
    }
    try {
      engine.ReconstructTo(key, out);
      out.flush();
      if (!out) {
        throw pv::IoError(pv::errors::io::kOutputWriteFailed,
                          "failed to flush " + pv::PathToUtf8String(output));
      }
    } catch (const pv::Error&) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(output, ec);
      throw;
    }
    return kExitOk;
  }

  int HandleList(pv::metadata::MetadataStore& store) {
    for (const auto& fileset : store.ListFilesets()) {
      std::cout << fileset.id << '\t' << (fileset.is_shadow ? "shadow" : "canonical") << '\t'
                << fileset.size << '\t' << fileset.hash << '\t' << fileset.key << '\n';
    }
    return kExitOk;
  }

  int HandleVerify(pv::engine::PackageEngine& engine, pv::metadata::MetadataStore& store,
                   const std::optional<std::string>& key) {
    std::vector<std::string> keys;
    if (key) {
      keys.push_back(*key);
    } else {
      std::set<std::string> unique;
      for (const auto& fileset : store.ListFilesets()) {
        if (unique.insert(fileset.key).second) {
          keys.push_back(fileset.key);
        }
      }
    }
    int exit_code = kExitOk;
    for (const auto& entry : keys) {
      try {
        engine.Verify(entry);
        std::cout << "ok " << entry << '\n';
      } catch (const pv::IntegrityError& err) {
        std::cout << "CORRUPT " << entry << ": " << err.what() << '\n';
        exit_code = kExitData;
      }
    }
    return exit_code;
  }

  int HandlePackages(pv::metadata::MetadataStore& store) {
    for (const auto& package : store.ListRootPackages()) {
      std::cout << package.key << '\t' << package.category << '\t' << package.index << '\t'
                << package.size << '\t' << (package.multifile ? "multifile" : "single") << '\t'
                << (package.sealed ? "sealed" : "open") << "\tg" << package.generation << '\n';
    }
    return kExitOk;
  }

  void PrintCompaction(const pv::storage::CompactionResult& result) {
    std::cout << "compacted " << result.package_key << " g" << result.generation << ' '
              << result.bytes_before << " -> " << result.bytes_after << " ("
              << result.live_blocks << " blocks)\n";
  }

  int HandleDelete(pv::engine::PackageEngine& engine, const std::vector<std::string>& args) {
    bool compact = true;
    if (args.size() == 2) {
      if (args[1] != "--keep-space") {
        PrintUsage();
        return kExitUsage;
      }
      compact = false;
    }
    const auto outcome = engine.DeleteFileset(args[0], compact);
    std::cout << "deleted " << outcome.removal.removed.key << " #" << outcome.removal.removed.id
              << '\n';
    if (outcome.removal.promoted) {
      std::cout << "promoted #" << outcome.removal.promoted->id << ' '
                << outcome.removal.promoted->key << '\n';
    }
    for (const auto& result : outcome.compactions) {
      PrintCompaction(result);
    }
    return kExitOk;
  }

  int HandleRestorePackage(pv::engine::PackageEngine& engine, const std::vector<std::string>& args) {
    auto policy = pv::engine::ConflictPolicy::kSkip;
    if (args.size() == 3) {
      const auto parsed = pv::engine::ParseConflictPolicy(args[2]);
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      policy = *parsed;
    }
    int exit_code = kExitOk;
    for (const auto& result : engine.RestorePackage(args[0], args[1], policy)) {
      if (result.ok()) {
        std::cout << (result.skipped ? "skipped " : "restored ")
                  << pv::PathToUtf8String(result.destination) << '\n';
        continue;
      }
      std::cerr << "failed " << result.entry.fileset_source_key << ": " << result.message << '\n';
      try {
        std::rethrow_exception(result.error);
      } catch (const pv::Error& err) {
        exit_code = std::max(exit_code, ExitCodeFor(err));
      } catch (const std::exception&) {
        exit_code = std::max(exit_code, kExitIO);
      }
    }
    return exit_code;
  }

} // namespace

int main(int argc, char** argv) {
  pv::log::EventBus bus;
  std::unique_ptr<pv::log::JsonLineLogger> logger;
  pv::core::CancellationToken cancel;
  try {
    std::optional<std::filesystem::path> repo;
    std::optional<std::string> key_hex;
    std::optional<std::filesystem::path> log_path;
    bool verbose = false;

    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg.rfind("--repo=", 0) == 0) {
        repo = std::filesystem::path(std::string(arg.substr(7)));
      } else if (arg.rfind("--key-hex=", 0) == 0) {
        key_hex = std::string(arg.substr(10));
      } else if (arg.rfind("--log=", 0) == 0) {
        log_path = std::filesystem::path(std::string(arg.substr(6)));
      } else if (arg == "--verbose") {
        verbose = true;
      } else {
        PrintUsage();
        return kExitUsage;
      }
    }
    if (!repo || repo->empty() || index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string command = argv[index++];
    std::vector<std::string> args(argv + index, argv + argc);

    if (log_path) {
      logger = std::make_unique<pv::log::JsonLineLogger>(*log_path, pv::log::ResolveLogMaxBytes());
    } else {
      logger = std::make_unique<pv::log::JsonLineLogger>(std::clog);
    }
    bus.SetMinimumSeverity(verbose ? pv::log::EventSeverity::kInfo
                                   : pv::log::EventSeverity::kWarning);
    bus.Subscribe([sink = logger.get()](const pv::log::Event& event) { sink->Log(event); });

    std::error_code ec;
    std::filesystem::create_directories(*repo, ec);
    if (ec) {
      throw pv::IoError(pv::errors::io::kBlobOpenFailed,
                        "cannot create repository " + pv::PathToUtf8String(*repo), ec.value());
    }

    pv::metadata::JournalMetadataStore store(*repo / kJournalName);
    if (store.discarded_tail_bytes() > 0) {
      pv::log::Event event;
      event.category = pv::log::EventCategory::kIntegrity;
      event.severity = pv::log::EventSeverity::kWarning;
      event.event_id = "journal_tail_discarded";
      event.message = "discarded incomplete journal tail";
      event.fields.emplace_back("bytes", std::to_string(store.discarded_tail_bytes()),
                                pv::log::FieldPrivacy::kPublic, true);
      bus.Publish(event);
    }
    pv::storage::LocalBlobStore blobs(*repo / kBlobDirName, &bus);
    pv::engine::PackageEngine engine(BuildJobConfig(*repo, key_hex), blobs, store, &bus);

    g_cancel.store(&cancel, std::memory_order_release);
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    int exit_code = kExitUsage;
    if (command == "ingest" && !args.empty()) {
      exit_code = HandleIngest(engine, args, cancel);
    } else if (command == "restore" && args.size() == 2) {
      exit_code = HandleRestore(engine, args[0], args[1]);
    } else if (command == "list" && args.empty()) {
      exit_code = HandleList(store);
    } else if (command == "verify" && args.size() <= 1) {
      exit_code = HandleVerify(engine, store,
                               args.empty() ? std::nullopt : std::optional<std::string>(args[0]));
    } else if (command == "packages" && args.empty()) {
      exit_code = HandlePackages(store);
    } else if (command == "delete" && (args.size() == 1 || args.size() == 2)) {
      exit_code = HandleDelete(engine, args);
    } else if (command == "compact" && args.size() == 1) {
      PrintCompaction(engine.CompactPackage(args[0]));
      exit_code = kExitOk;
    } else if (command == "restore-package" && (args.size() == 2 || args.size() == 3)) {
      exit_code = HandleRestorePackage(engine, args);
    } else {
      PrintUsage();
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel.store(nullptr, std::memory_order_release);
    return exit_code;
  } catch (const pv::Error& err) {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel.store(nullptr, std::memory_order_release);
    ReportError(bus, err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel.store(nullptr, std::memory_order_release);
    std::cerr << "Error: " << err.what() << '\n';
    return kExitIO;
  }
}
