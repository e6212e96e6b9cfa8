#include "glacierup/config.hpp"
#include "glacierup/chunk_reader.hpp"
#include "glacierup/constants.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <nlohmann/json.hpp>
#include <type_traits>

namespace glacierup {

const std::vector<std::string>& known_commands() {
    static const std::vector<std::string> commands = {
        "upload",
        "list-uploads",
        "list-parts",
        "init-archive-retrieval",
        "init-inventory-retrieval",
        "describe-job",
        "get-job-output",
        "abort-upload",
        "delete-archive",
    };
    return commands;
}

// --- BackendConfig ---

namespace {

bool is_secret_param(const std::string& key) {
    return key == "access_key" || key == "secret_key" || key == "session_token";
}

bool has_param(const BackendConfig& bc, const std::string& key) {
    auto it = bc.params.find(key);
    return it != bc.params.end() && !it->second.empty();
}

} // namespace

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "glacier") {
        if (!has_param(*this, "access_key"))
            return "glacier backend requires 'access_key' (--access-key or AWS_ACCESS_KEY_ID)";
        if (!has_param(*this, "secret_key"))
            return "glacier backend requires 'secret_key' (--secret-key or AWS_SECRET_ACCESS_KEY)";
        if (!has_param(*this, "region") && !has_param(*this, "endpoint"))
            return "glacier backend requires 'region' or 'endpoint'";
    } else if (type == "local") {
        if (!has_param(*this, "path"))
            return "local backend requires 'path'";
        if (!std::filesystem::is_directory(params.at("path")))
            return "local backend path is not a directory: " + params.at("path");
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

std::map<std::string, std::string> BackendConfig::masked_params() const {
    auto out = params;
    for (auto& [key, value] : out) {
        if (is_secret_param(key) && !value.empty()) value = "****";
    }
    return out;
}

// --- AppConfig ---

namespace {

// Route a backend flag to its params key. Returns nullptr if `arg` is not one.
const char* backend_param_for(const std::string& arg) {
    static const std::map<std::string, const char*> flags = {
        {"--region", "region"},        {"-r", "region"},
        {"--endpoint", "endpoint"},
        {"--account-id", "account_id"},
        {"--access-key", "access_key"},
        {"--secret-key", "secret_key"},
        {"--session-token", "session_token"},
        {"--ca-cert", "ca_bundle"},
        {"--local-path", "path"},
        {"--job-delay", "job_delay"},
        {"--list-limit", "list_limit"},
    };
    auto it = flags.find(arg);
    return it == flags.end() ? nullptr : it->second;
}

bool parse_u64(const char* name, const char* value, uint64_t& out) {
    try {
        size_t pos = 0;
        std::string s = value;
        if (!s.empty() && s[0] != '-') {
            out = std::stoull(s, &pos);
            if (pos == s.size()) return true;
        }
    } catch (const std::exception&) {
        // reported below
    }
    std::cerr << "Error: " << name << " expects a non-negative integer, got '" << value << "'\n";
    return false;
}

void print_usage() {
    std::cerr <<
        "Usage: glacier-upload <command> --vault-name <vault> [options]\n"
        "\n"
        "Commands:\n"
        "  upload                           Upload a file (multipart, resumable)\n"
        "  list-uploads                     List in-progress multipart uploads\n"
        "  list-parts                       List uploaded parts of a multipart upload\n"
        "  init-archive-retrieval           Start an archive retrieval job\n"
        "  init-inventory-retrieval         Start an inventory retrieval job\n"
        "  describe-job                     Show the status of a job\n"
        "  get-job-output                   Download the output of a completed job\n"
        "  abort-upload                     Abort a multipart upload\n"
        "  delete-archive                   Delete an archive\n"
        "\n"
        "Common:\n"
        "  -v, --vault-name <name>          Vault name (required)\n"
        "  --config <path>                  JSON config file\n"
        "  --backend <glacier|local>        Vault backend (default: glacier)\n"
        "  -r, --region <region>            AWS region (or AWS_REGION env, default: us-east-1)\n"
        "  --endpoint <url>                 Override the service endpoint\n"
        "  --account-id <id>                Account id (default: -)\n"
        "  --access-key <key>               Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --secret-key <key>               Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --session-token <token>          Session token (or AWS_SESSION_TOKEN env)\n"
        "  --ca-cert <path>                 CA certificate bundle for SSL\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --local-path <path>              Vault root directory (local backend)\n"
        "  --job-delay <secs>               Seconds before local jobs complete (local backend)\n"
        "  --connect-timeout <secs>         Connect timeout per request (default: 10)\n"
        "  --request-timeout <secs>         Total timeout per request (default: 300)\n"
        "  --max-retries <N>                Attempts per request (default: 10)\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "\n"
        "Upload:\n"
        "  -f, --file-name <path>           File to upload (no symlinks)\n"
        "  -d, --arc-desc <text>            Archive description\n"
        "  -p, --part-size <MB>             Part size in MB, power of two 1..4096 (default: 8)\n"
        "  -t, --num-threads <N>            Concurrent upload threads (default: 5)\n"
        "  -u, --upload-id <id>             Resume this multipart upload\n"
        "  --single-request-threshold <B>   Files up to this size use one request (default: 4194304)\n"
        "  --force-multipart                Always use a multipart upload\n"
        "  --fail-on-digest-mismatch        Do not retry parts whose checksum the remote rejects\n"
        "\n"
        "Jobs:\n"
        "  -j, --job-id <id>                Job id\n"
        "  -a, --archive-id <id>            Archive id\n"
        "  --tier <tier>                    Expedited, Standard or Bulk\n"
        "  --format <JSON|CSV>              Inventory format (default: JSON)\n"
        "  -o, --output <path>              Archive output file (default: glacier_archive.bin)\n"
        "  --segment-size <MB>              Download segment size in MB (default: 16)\n"
        "  --wait                           Poll until the job completes\n"
        "  --poll-interval <secs>           Poll interval (default: 900)\n"
        "  --timeout <secs>                 Give up waiting after this long (default: 0 = never)\n"
        "  --help                           Show this help\n";
}

std::string json_param_string(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

std::optional<AppConfig> AppConfig::from_args(int argc, char* argv[]) {
    AppConfig config;

    int first = 1;
    if (argc > 1 && argv[1][0] != '-') {
        config.command = argv[1];
        first = 2;
    }

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto next_number = [&](int& i, const std::string& name, auto& field) -> bool {
        auto* v = next_arg(i, name.c_str());
        if (!v) return false;
        uint64_t n = 0;
        if (!parse_u64(name.c_str(), v, n)) return false;
        field = static_cast<std::remove_reference_t<decltype(field)>>(n);
        return true;
    };

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (const char* key = backend_param_for(arg)) {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.backend.params[key] = v;
            continue;
        }

        if (arg == "--vault-name" || arg == "-v") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.vault = v;
        } else if (arg == "--backend") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.backend.type = v;
        } else if (arg == "--no-verify-ssl") {
            config.backend.params["verify_ssl"] = "false";
        } else if (arg == "--config") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--file-name" || arg == "-f") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.file = v;
        } else if (arg == "--arc-desc" || arg == "-d") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.description = v;
        } else if (arg == "--part-size" || arg == "-p") {
            if (!next_number(i, arg, config.part_size_mb)) return std::nullopt;
        } else if (arg == "--num-threads" || arg == "-t") {
            if (!next_number(i, arg, config.upload_threads)) return std::nullopt;
        } else if (arg == "--max-retries") {
            if (!next_number(i, arg, config.max_retries)) return std::nullopt;
        } else if (arg == "--single-request-threshold") {
            if (!next_number(i, arg, config.single_request_threshold)) return std::nullopt;
        } else if (arg == "--force-multipart") {
            config.force_multipart = true;
        } else if (arg == "--fail-on-digest-mismatch") {
            config.fail_on_digest_mismatch = true;
        } else if (arg == "--upload-id" || arg == "-u") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.upload_id = v;
        } else if (arg == "--job-id" || arg == "-j") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.job_id = v;
        } else if (arg == "--archive-id" || arg == "-a") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.archive_id = v;
        } else if (arg == "--tier") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.tier = v;
        } else if (arg == "--format") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.inventory_format = v;
        } else if (arg == "--output" || arg == "-o") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.output_file = v;
        } else if (arg == "--segment-size") {
            if (!next_number(i, arg, config.segment_size_mb)) return std::nullopt;
        } else if (arg == "--wait") {
            config.wait = true;
        } else if (arg == "--poll-interval") {
            if (!next_number(i, arg, config.poll_interval_secs)) return std::nullopt;
        } else if (arg == "--timeout") {
            if (!next_number(i, arg, config.poll_timeout_secs)) return std::nullopt;
        } else if (arg == "--connect-timeout") {
            if (!next_number(i, arg, config.connect_timeout_secs)) return std::nullopt;
        } else if (arg == "--request-timeout") {
            if (!next_number(i, arg, config.request_timeout_secs)) return std::nullopt;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            if (!next_number(i, arg, config.metrics_interval_secs)) return std::nullopt;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }
    const auto& commands = known_commands();
    if (std::find(commands.begin(), commands.end(), config.command) == commands.end()) {
        std::cerr << "Error: unknown command: " << config.command << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool AppConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("vault")) vault = j["vault"].get<std::string>();
        if (j.contains("file")) file = j["file"].get<std::string>();
        if (j.contains("description")) description = j["description"].get<std::string>();
        if (j.contains("part_size_mb")) part_size_mb = j["part_size_mb"].get<uint64_t>();
        if (j.contains("upload_threads")) upload_threads = j["upload_threads"].get<size_t>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<uint32_t>();
        if (j.contains("single_request_threshold"))
            single_request_threshold = j["single_request_threshold"].get<uint64_t>();
        if (j.contains("force_multipart")) force_multipart = j["force_multipart"].get<bool>();
        if (j.contains("fail_on_digest_mismatch"))
            fail_on_digest_mismatch = j["fail_on_digest_mismatch"].get<bool>();
        if (j.contains("tier")) tier = j["tier"].get<std::string>();
        if (j.contains("inventory_format")) inventory_format = j["inventory_format"].get<std::string>();
        if (j.contains("output_file")) output_file = j["output_file"].get<std::string>();
        if (j.contains("segment_size_mb")) segment_size_mb = j["segment_size_mb"].get<uint64_t>();
        if (j.contains("poll_interval")) poll_interval_secs = j["poll_interval"].get<uint32_t>();
        if (j.contains("poll_timeout")) poll_timeout_secs = j["poll_timeout"].get<uint32_t>();
        if (j.contains("connect_timeout")) connect_timeout_secs = j["connect_timeout"].get<uint32_t>();
        if (j.contains("request_timeout")) request_timeout_secs = j["request_timeout"].get<uint32_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key != "type") {
                    backend.params[key] = json_param_string(val);
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void AppConfig::apply_defaults() {
    if (backend.type != "glacier") return;

    auto from_env = [&](const char* key, std::initializer_list<const char*> vars) {
        if (has_param(backend, key)) return;
        for (const char* var : vars) {
            if (const char* v = std::getenv(var); v && *v) {
                backend.params[key] = v;
                return;
            }
        }
    };
    from_env("access_key", {"AWS_ACCESS_KEY_ID"});
    from_env("secret_key", {"AWS_SECRET_ACCESS_KEY"});
    from_env("session_token", {"AWS_SESSION_TOKEN"});
    from_env("region", {"AWS_REGION", "AWS_DEFAULT_REGION"});

    if (!has_param(backend, "region")) backend.params["region"] = constants::DEFAULT_REGION;
    if (!has_param(backend, "connect_timeout"))
        backend.params["connect_timeout"] = std::to_string(connect_timeout_secs);
    if (!has_param(backend, "request_timeout"))
        backend.params["request_timeout"] = std::to_string(request_timeout_secs);
}

std::string AppConfig::validate() const {
    if (command.empty()) return "command is required";
    if (vault.empty()) return "vault name is required (--vault-name)";

    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;

    if (command == "upload") {
        if (file.empty()) return "file is required (--file-name)";
        if (std::filesystem::is_symlink(file)) return "file can not be a symlink: " + file.string();
        if (!std::filesystem::is_regular_file(file)) return "file does not exist or is not a regular file: " + file.string();
        if (!is_valid_part_size(part_size_bytes()))
            return "part size must be a power of two between 1 and 4096 MB, got " +
                   std::to_string(part_size_mb);
        if (upload_id.empty()) {
            // A resumed upload takes its part size from the remote session.
            std::error_code ec;
            uint64_t size = std::filesystem::file_size(file, ec);
            uint64_t parts = ec ? 0 : (size + part_size_bytes() - 1) / part_size_bytes();
            if (parts > constants::MAX_PARTS_PER_UPLOAD) {
                uint64_t needed = min_part_size_for(size);
                return "file needs " + std::to_string(parts) + " parts of " +
                       std::to_string(part_size_mb) + " MB, more than the " +
                       std::to_string(constants::MAX_PARTS_PER_UPLOAD) + " allowed" +
                       (needed ? "; use --part-size " +
                                     std::to_string(needed / constants::MIN_PART_SIZE) + " or larger"
                               : "; the file is larger than the largest possible archive");
            }
        }
        if (upload_threads == 0) return "num_threads must be > 0";
        if (max_retries == 0) return "max_retries must be > 0";
    } else if (command == "list-parts" || command == "abort-upload") {
        if (upload_id.empty()) return "upload id is required (--upload-id)";
    } else if (command == "describe-job" || command == "get-job-output") {
        if (job_id.empty()) return "job id is required (--job-id)";
    } else if (command == "init-archive-retrieval" || command == "delete-archive") {
        if (archive_id.empty()) return "archive id is required (--archive-id)";
    }

    if (!tier.empty() && tier != "Expedited" && tier != "Standard" && tier != "Bulk")
        return "tier must be Expedited, Standard or Bulk, got " + tier;
    if (inventory_format != "JSON" && inventory_format != "CSV")
        return "inventory format must be JSON or CSV, got " + inventory_format;
    if (segment_size_mb == 0) return "segment size must be > 0";
    return {};
}

std::vector<std::string> AppConfig::describe() const {
    std::vector<std::string> lines;
    lines.push_back("command: " + command);
    lines.push_back("vault: " + vault);
    lines.push_back("backend: " + backend.type);
    for (const auto& [key, value] : backend.masked_params()) {
        lines.push_back("  " + key + ": " + value);
    }
    if (command == "upload") {
        lines.push_back("file: " + file.string());
        lines.push_back("part size: " + std::to_string(part_size_mb) + " MB");
        lines.push_back("threads: " + std::to_string(upload_threads));
        lines.push_back("max retries: " + std::to_string(max_retries));
        if (!upload_id.empty()) lines.push_back("resume upload id: " + upload_id);
    }
    if (!job_id.empty()) lines.push_back("job id: " + job_id);
    if (!archive_id.empty()) lines.push_back("archive id: " + archive_id);
    return lines;
}

} // namespace glacierup
