#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>

#include "aigate_common.hpp"
#include "aigate_entry.hpp"
#include "common_macros.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace po = boost::program_options;

namespace {

namespace js = boost::json;

struct DefaultPaths {
  fs::path config_dir;
  fs::path runtime_dir;
};

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// AIGATE_CONFIG_DIR / AIGATE_RUNTIME_DIR win; otherwise the XDG locations
// under $HOME, falling back to the working directory.
DefaultPaths resolve_default_paths() {
  fs::path config_dir = get_env_path("AIGATE_CONFIG_DIR");
  fs::path runtime_dir = get_env_path("AIGATE_RUNTIME_DIR");

  fs::path home = get_env_path("HOME");
  if (config_dir.empty()) {
    fs::path xdg_config = get_env_path("XDG_CONFIG_HOME");
    if (!xdg_config.empty()) {
      config_dir = xdg_config / "aigate";
    } else if (!home.empty()) {
      config_dir = home / ".config" / "aigate";
    } else {
      config_dir = fs::path("aigate-config");
    }
  }
  if (runtime_dir.empty()) {
    fs::path xdg_state = get_env_path("XDG_STATE_HOME");
    if (!xdg_state.empty()) {
      runtime_dir = xdg_state / "aigate";
    } else if (!home.empty()) {
      runtime_dir = home / ".local" / "state" / "aigate";
    } else {
      runtime_dir = fs::path("aigate-runtime");
    }
  }
  return {config_dir, runtime_dir};
}

void ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

bool bootstrap_default_config_dir(const fs::path &config_dir,
                                  const fs::path &runtime_dir) {
  std::error_code ec;
  fs::create_directories(config_dir, ec);
  if (ec && !fs::exists(config_dir)) {
    std::cerr << "Warning: unable to create default config directory '"
              << config_dir << "': " << ec.message() << std::endl;
    return false;
  }

  try {
    js::object application{{"api_key", ""},
                           {"bundle_id", ""},
                           {"team_id", ""},
                           {"environment", "production"},
                           {"timeout_seconds", 60},
                           {"attestation_mode", "auto"},
                           {"verify_tls", true},
                           {"stream_buffer_chunks", 64},
                           {"worker_threads", 2},
                           {"verbose", "info"},
                           {"runtime_dir", runtime_dir.string()}};
    write_json_if_missing(config_dir / "application.json", application);

    js::object log{{"level", "info"},
                   {"log_dir", (runtime_dir / "logs").string()},
                   {"log_file", "aigate"},
                   {"rotation_size", 10 * 1024 * 1024}};
    write_json_if_missing(config_dir / "log_config.json", log);
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }
  return true;
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

} // namespace

int RunAigateApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-v" || arg == "--version" || arg == "version") {
      std::cout << MYAPP_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("aigate signed API client");

    aigate::CliParams cli_params;
    std::vector<std::string> config_dirs_args;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->notifier([&](const std::vector<std::string> &profiles) mutable {
               if (profiles.empty()) {
                 cli_params.profiles.push_back("default");
               }
             }),
         "profiles to use from the configuration file.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all output.") //
        ("body,b",
         po::value<std::string>()->value_name("JSON")->notifier(
             [&](const std::string &value) { cli_params.body = value; }),
         "JSON request body for sign, post and stream.") //
        ("url-base",
         po::value<std::string>()->value_name("URL")->notifier(
             [&](const std::string &value) {
               cli_params.url_base_override = value;
             }),
         "override the API base URL for this run without persisting") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    for (const auto &dir_str : config_dirs_args) {
      fs::path config_dir(dir_str);
      if (!fs::exists(config_dir)) {
        throw std::runtime_error("Config directory does not exist: " +
                                 config_dir.string());
      }
      cli_params.config_dirs.push_back(std::move(config_dir));
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl
                << "  sign [--body JSON]            Print signing headers."
                << std::endl
                << "  post <path> [--body JSON]     Send a signed request."
                << std::endl
                << "  stream <path> --body JSON     Stream a chat completion."
                << std::endl
                << "  attestation status|register|reset" << std::endl
                << "                                Inspect or manage device "
                   "attestation."
                << std::endl
                << std::endl;
    };

    if (vm.count("help") || cli_params.subcmd.empty()) {
      showUsage();
      return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const DefaultPaths defaults = resolve_default_paths();
    const bool default_config_available =
        bootstrap_default_config_dir(defaults.config_dir, defaults.runtime_dir);

    std::vector<fs::path> ordered_config_dirs;
    if (default_config_available && fs::exists(defaults.config_dir)) {
      add_unique_path(ordered_config_dirs, defaults.config_dir);
    }
    for (const auto &dir : cli_params.config_dirs) {
      add_unique_path(ordered_config_dirs, dir);
    }
    if (ordered_config_dirs.empty()) {
      std::cerr << "No configuration directories found. Provide --config-dirs"
                << " or ensure the default directory '" << defaults.config_dir
                << "' is accessible." << std::endl;
      return EXIT_FAILURE;
    }
    cli_params.config_dirs = ordered_config_dirs;

    std::map<std::string, std::string> cli_overrides;
    if (cli_params.url_base_override &&
        !cli_params.url_base_override->empty()) {
      cli_overrides.emplace("url_base", *cli_params.url_base_override);
    }

    static aigate::ConfigSources config_sources(
        cli_params.config_dirs, cli_params.profiles, std::move(cli_overrides));

    aigate::LoggingConfig logging_config = config_sources.logging_config();
    {
      fs::path log_dir(logging_config.log_dir);
      if (log_dir.is_relative()) {
        log_dir = defaults.runtime_dir / log_dir;
      }
      ensure_directory_exists(log_dir);
      logging_config.log_dir = log_dir.string();
      DEBUG_PRINT("log dir: " << logging_config.log_dir);
      aigate::init_my_log(logging_config);
    }
    cli_params.runtime_dir = defaults.runtime_dir;

    static aigate::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                  std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose") &&
        config_sources.application_json) {
      auto config = js::value_to<aigate::AigateConfig>(
          *config_sources.application_json);
      if (!config.verbose.empty()) {
        cli_ctx.params.verbose = config.verbose;
      }
    }

    return aigate::launch(config_sources, cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunAigateApplication(argc, argv); }
