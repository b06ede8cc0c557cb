#include <signal.h>

#include <atomic>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "bits3/common.h"
#include "bits3/config.h"
#include "bits3/crypto/kdf.h"
#include "bits3/crypto/provider.h"
#include "bits3/error.h"
#include "bits3/orchestrator/backup_cycle.h"
#include "bits3/orchestrator/event_bus.h"
#include "bits3/orchestrator/pipeline.h"
#include "bits3/progress/progress_reporter.h"
#include "bits3/security/zeroizer.h"
#include "bits3/store/directory_store.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitNoInput = 66;
  constexpr int kExitUnavailable = 69;
  constexpr int kExitSoftware = 70;
  constexpr int kExitIO = 74;
  constexpr int kExitPartUpload = 75;
  constexpr int kExitCompletion = 76;
  constexpr int kExitInterrupted = 130;

  constexpr std::string_view kEnvPrefix = "BITS3_";

  std::atomic<bool> g_interrupted{false};

  void InterruptHandler(int) { g_interrupted.store(true); }

  // Routes SIGINT/SIGTERM to the pipeline's cancellation flag while alive.
  class InterruptSignalGuard {
   public:
    InterruptSignalGuard() {
      struct sigaction sa {};
      sa.sa_handler = InterruptHandler;
      sigemptyset(&sa.sa_mask);
      sa.sa_flags = 0;
      sigaction(SIGINT, &sa, &old_int_);
      sigaction(SIGTERM, &sa, &old_term_);
    }
    ~InterruptSignalGuard() {
      sigaction(SIGINT, &old_int_, nullptr);
      sigaction(SIGTERM, &old_term_, nullptr);
    }

   private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
  };

  void PrintUsage() {
    std::cerr << "bits3: encrypted streaming backups to an object store\n";
    std::cerr << "Usage:\n";
    std::cerr << "  bits3 upload <source-dir> [options]\n";
    std::cerr << "  bits3 cycle  <backintime-dir> [options]\n";
    std::cerr << "\nOptions (each also read from BITS3_<NAME>, e.g. BITS3_SECRET):\n";
    std::cerr << "  --store-root=DIR       Directory holding the buckets (required)\n";
    std::cerr << "  --bucket=NAME          Target bucket (required)\n";
    std::cerr << "  --secret=TEXT          Encryption passphrase (required)\n";
    std::cerr << "  --key=NAME             Object key (default <dir>.tar.bs3)\n";
    std::cerr << "  --storage-class=CLASS  STANDARD|STANDARD_IA|GLACIER|DEEP_ARCHIVE (default STANDARD_IA)\n";
    std::cerr << "  --part-size=N[K|M|G]   Upload part size (default 64M)\n";
    std::cerr << "  --window=N             Parts uploaded concurrently (default 3)\n";
    std::cerr << "  --retries=N            Retries per part on transient errors (default 5)\n";
    std::cerr << "  --segment-size=N[K|M]  Cipher segment size (default 64K)\n";
    std::cerr << "  --kdf=NAME             pbkdf2-sha256|argon2id (default pbkdf2-sha256)\n";
    std::cerr << "  --kdf-iterations=N     PBKDF2 rounds or Argon2id time cost\n";
    std::cerr << "  --kdf-memory=KIB       Argon2id memory cost\n";
    std::cerr << "  --progress             Show upload progress on stderr\n";
    std::cerr << "  --loglevel=LEVEL       DEBUG|INFO|WARNING|ERROR|CRITICAL (default INFO)\n";
    std::cerr << "  --log-file=PATH        Append JSON log lines to PATH instead of stderr\n";
    std::cerr << "\ncycle only:\n";
    std::cerr << "  --days=N               Minimum days between uploads (default 90)\n";
    std::cerr << "  --keep=N               Uploads kept after a new one (default 1)\n";
  }

  [[noreturn]] void UsageError(const std::string& message) {
    throw bits3::MakeError(bits3::errors::kConfiguration, message);
  }

  // --name=value options from the command line, falling back to
  // BITS3_<NAME> in the environment.
  class OptionSet {
   public:
    void Set(std::string name, std::string value) { values_[std::move(name)] = std::move(value); }

    std::optional<std::string> Get(const std::string& name) const {
      auto it = values_.find(name);
      if (it != values_.end()) {
        return it->second;
      }
      std::string env(kEnvPrefix);
      for (char c : name) {
        env.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
      }
      if (const char* value = std::getenv(env.c_str())) {
        return std::string(value);
      }
      return std::nullopt;
    }

    std::string Require(const std::string& name) const {
      auto value = Get(name);
      if (!value || value->empty()) {
        UsageError("--" + name + " (or " + std::string(kEnvPrefix) + "...) is required");
      }
      return *value;
    }

    bool Flag(const std::string& name) const {
      auto value = Get(name);
      return value && (*value == "1" || *value == "true" || *value == "yes" || value->empty());
    }

   private:
    std::map<std::string, std::string> values_;
  };

  uint64_t ParseUnsigned(const std::string& name, std::string_view value, bool allow_suffix) {
    uint64_t multiplier = 1;
    if (allow_suffix && !value.empty()) {
      switch (value.back()) {
      case 'K':
      case 'k':
        multiplier = 1024;
        break;
      case 'M':
      case 'm':
        multiplier = 1024 * 1024;
        break;
      case 'G':
      case 'g':
        multiplier = 1024ull * 1024 * 1024;
        break;
      default:
        break;
      }
      if (multiplier != 1) {
        value.remove_suffix(1);
      }
    }
    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() ||
        parsed > UINT64_MAX / multiplier) {
      UsageError("--" + name + ": invalid number '" + std::string(value) + "'");
    }
    return parsed * multiplier;
  }

  uint32_t ParseU32(const OptionSet& options, const std::string& name, uint32_t fallback) {
    auto value = options.Get(name);
    if (!value) {
      return fallback;
    }
    auto parsed = ParseUnsigned(name, *value, false);
    if (parsed > UINT32_MAX) {
      UsageError("--" + name + ": value too large");
    }
    return static_cast<uint32_t>(parsed);
  }

  bits3::PipelineConfig BuildPipelineConfig(const OptionSet& options) {
    bits3::PipelineConfig config;
    config.bucket = options.Require("bucket");
    config.secret = options.Require("secret");
    config.key = options.Get("key").value_or("");
    config.storage_class = bits3::NormalizeStorageClass(
        options.Get("storage-class").value_or(std::string(bits3::kDefaultStorageClass)));
    if (auto part = options.Get("part-size")) {
      config.part_size_bytes = ParseUnsigned("part-size", *part, true);
    }
    config.max_in_flight_parts = ParseU32(options, "window", config.max_in_flight_parts);
    config.retry_limit = ParseU32(options, "retries", config.retry_limit);
    if (auto segment = options.Get("segment-size")) {
      auto parsed = ParseUnsigned("segment-size", *segment, true);
      if (parsed > UINT32_MAX) {
        UsageError("--segment-size: value too large");
      }
      config.cipher_segment_size = static_cast<uint32_t>(parsed);
    }
    if (auto kdf = options.Get("kdf")) {
      if (!bits3::crypto::ParseKdfAlgorithm(*kdf, config.kdf.algorithm)) {
        UsageError("--kdf: unknown algorithm '" + *kdf + "'");
      }
      if (config.kdf.algorithm == bits3::crypto::KdfAlgorithm::kArgon2id) {
        config.kdf.iterations = 3;
      }
    }
    config.kdf.iterations = ParseU32(options, "kdf-iterations", config.kdf.iterations);
    config.kdf.memory_kib = ParseU32(options, "kdf-memory", config.kdf.memory_kib);
    config.progress_enabled = options.Flag("progress");
    return config;
  }

  std::string_view DomainPrefix(bits3::ErrorDomain domain) {
    switch (domain) {
    case bits3::ErrorDomain::IO:
      return "I/O error";
    case bits3::ErrorDomain::Security:
      return "Security error";
    case bits3::ErrorDomain::Crypto:
      return "Cryptography error";
    case bits3::ErrorDomain::Validation:
      return "Validation error";
    case bits3::ErrorDomain::Config:
      return "Configuration error";
    case bits3::ErrorDomain::Store:
      return "Store error";
    case bits3::ErrorDomain::State:
      return "State error";
    case bits3::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  int ExitCodeFor(const bits3::Error& err) {
    switch (err.code) {
    case bits3::errors::kConfiguration:
      return kExitUsage;
    case bits3::errors::kSourceUnreadable:
      return kExitNoInput;
    case bits3::errors::kPartialRead:
      return kExitIO;
    case bits3::errors::kEncryptionFailure:
      return kExitSoftware;
    case bits3::errors::kSessionOpenFailure:
      return kExitUnavailable;
    case bits3::errors::kPartUploadFailure:
      return kExitPartUpload;
    case bits3::errors::kCompletionFailure:
      return kExitCompletion;
    case bits3::errors::kCancelled:
      return kExitInterrupted;
    default:
      break;
    }
    return kExitSoftware;
  }

  void ReportError(const bits3::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << bits3::DescribeError(err) << '\n';
  }

  std::unique_ptr<bits3::orchestrator::JsonLineLogger> MakeLogger(const OptionSet& options) {
    auto severity = bits3::orchestrator::EventSeverity::kInfo;
    if (auto level = options.Get("loglevel")) {
      auto parsed = bits3::orchestrator::ParseSeverity(*level);
      if (!parsed) {
        UsageError("--loglevel: unknown level '" + *level + "'");
      }
      severity = *parsed;
    }
    if (auto path = options.Get("log-file"); path && !path->empty()) {
      return std::make_unique<bits3::orchestrator::JsonLineLogger>(std::filesystem::path(*path),
                                                                   severity);
    }
    return std::make_unique<bits3::orchestrator::JsonLineLogger>(std::clog, severity);
  }

  class SubscriptionGuard {
   public:
    SubscriptionGuard(bits3::orchestrator::EventBus& bus,
                      bits3::orchestrator::EventBus::SubscriptionId id)
        : bus_(bus), id_(id) {}
    SubscriptionGuard(const SubscriptionGuard&) = delete;
    SubscriptionGuard& operator=(const SubscriptionGuard&) = delete;
    ~SubscriptionGuard() { bus_.Unsubscribe(id_); }

   private:
    bits3::orchestrator::EventBus& bus_;
    bits3::orchestrator::EventBus::SubscriptionId id_;
  };

  bits3::orchestrator::PipelineOptions MakePipelineOptions(const std::string& label) {
    bits3::orchestrator::PipelineOptions options;
    options.interrupt = &g_interrupted;
    options.progress_sink = [label](const bits3::progress::ProgressSnapshot& snapshot) {
      std::cerr << bits3::progress::RenderProgressLine(label, snapshot);
      if (snapshot.final) {
        std::cerr << '\n';
      }
      std::cerr << std::flush;
    };
    return options;
  }

  void PrintSummary(const bits3::orchestrator::RunReport& report) {
    const double seconds = static_cast<double>(report.elapsed.count()) / 1000.0;
    std::cout << "Uploaded " << report.bucket << '/' << report.key << ": " << report.bytes_uploaded
              << " bytes in " << report.parts << " part(s), " << seconds << " s\n";
  }

  int HandleUpload(const std::filesystem::path& source, const OptionSet& options) {
    auto config = BuildPipelineConfig(options);
    config.source_path = source;
    if (config.key.empty()) {
      config.key = bits3::DefaultObjectKey(source);
    }
    bits3::store::DirectoryObjectStore store(options.Require("store-root"));
    auto label = config.key;
    // The pipeline owns and wipes the secret from here on.
    bits3::orchestrator::Pipeline pipeline(std::move(config), store, MakePipelineOptions(label));
    auto report = pipeline.Run();
    if (!report.success) {
      ReportError(*report.error);
      return ExitCodeFor(*report.error);
    }
    PrintSummary(report);
    return kExitOk;
  }

  int HandleCycle(const std::filesystem::path& backup_root, const OptionSet& options) {
    bits3::orchestrator::CycleConfig cycle;
    cycle.backup_root = backup_root;
    cycle.pipeline = BuildPipelineConfig(options);
    bits3::security::Zeroizer::ScopeWiper<char> secret_guard(cycle.pipeline.secret.data(),
                                                             cycle.pipeline.secret.size());
    cycle.upload_interval_days = ParseU32(options, "days", cycle.upload_interval_days);
    cycle.keep = ParseU32(options, "keep", cycle.keep);

    bits3::store::DirectoryObjectStore store(options.Require("store-root"));
    auto report = bits3::orchestrator::RunBackupCycle(
        cycle, store, MakePipelineOptions(cycle.pipeline.key.empty() ? "upload" : cycle.pipeline.key));
    switch (report.outcome) {
    case bits3::orchestrator::CycleOutcome::kNotDue:
      std::cout << "Last upload is recent enough; nothing to do.\n";
      return kExitOk;
    case bits3::orchestrator::CycleOutcome::kUploaded:
      PrintSummary(*report.run);
      for (const auto& key : report.pruned.deleted) {
        std::cout << "Deleted old upload " << key << '\n';
      }
      return kExitOk;
    case bits3::orchestrator::CycleOutcome::kFailed:
      break;
    }
    const auto error = report.error ? *report.error
                                    : bits3::MakeError(bits3::errors::kInternal, "cycle failed");
    ReportError(error);
    return ExitCodeFor(error);
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 3) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string cmd = argv[1];
    std::optional<std::filesystem::path> target;
    OptionSet options;
    for (int i = 2; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return kExitOk;
      }
      if (arg.rfind("--", 0) == 0) {
        arg.remove_prefix(2);
        auto eq = arg.find('=');
        if (eq == std::string_view::npos) {
          options.Set(std::string(arg), "");
        } else {
          options.Set(std::string(arg.substr(0, eq)), std::string(arg.substr(eq + 1)));
        }
        continue;
      }
      if (target || arg.empty() || arg.find('\0') != std::string_view::npos) {
        PrintUsage();
        return kExitUsage;
      }
      target = std::filesystem::path(std::string(arg));
    }
    if (!target) {
      PrintUsage();
      return kExitUsage;
    }

    auto logger = MakeLogger(options);
    auto& bus = bits3::orchestrator::EventBus::Instance();
    SubscriptionGuard subscription(
        bus, bus.Subscribe([&logger](const bits3::orchestrator::Event& event) { logger->Log(event); }));
    bits3::crypto::EnsureCryptoProviderInitialized();
    InterruptSignalGuard signals;

    int rc = kExitUsage;
    if (cmd == "upload") {
      rc = HandleUpload(*target, options);
    } else if (cmd == "cycle") {
      rc = HandleCycle(*target, options);
    } else {
      PrintUsage();
    }
    return rc;
  } catch (const bits3::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "Internal error: " << err.what() << std::endl;
    return kExitSoftware;
  }
}
