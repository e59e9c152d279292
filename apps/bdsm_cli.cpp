#include "bdsm/config/options.hpp"
#include "bdsm/core/errors.hpp"
#include "bdsm/core/utils.hpp"
#include "bdsm/image/image.hpp"
#include "bdsm/interface/interface.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// "key=value" -> overrides[key] = YAML value
static void add_override(YAML::Node& overrides, const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw bdsm::ConfigError("expected key=value, got '" + assignment + "'");
    }
    const std::string key = bdsm::core::trim(assignment.substr(0, eq));
    const std::string value = bdsm::core::trim(assignment.substr(eq + 1));
    overrides[key] = YAML::Load(value);
}

static bdsm::config::Options base_options(const std::string& config_path) {
    if (config_path.empty()) {
        return bdsm::config::Options{};
    }
    return bdsm::config::Options::load(config_path);
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << bdsm::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config (--path P | --yaml Y | --stdin)
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = bdsm::core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }
        YAML::Node node = YAML::Load(yaml_text);
        bdsm::config::Options opts = bdsm::config::Options::from_yaml(node);
        opts.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

// ============================================================================
// list-pars [--config P] [--set k=v ...]
// ============================================================================
int cmd_list_pars(const bdsm::config::Options& base, const YAML::Node& overrides) {
    bdsm::image::Image img(base);
    if (!img.set_pars(overrides)) return 1;
    img.list_pars();
    return 0;
}

// ============================================================================
// save-pars <savefile> [--config P] [--set k=v ...]
// ============================================================================
int cmd_save_pars(const bdsm::config::Options& base, const YAML::Node& overrides,
                  const std::string& savefile) {
    bdsm::image::Image img(base);
    if (!img.set_pars(overrides)) return 1;
    return img.save_pars(savefile) ? 0 : 1;
}

// ============================================================================
// process <image> [--config P] [--set k=v ...] [--log P] [--export TYPE]
//                 [--handoff]
// ============================================================================
int cmd_process(const bdsm::config::Options& base, const YAML::Node& overrides,
                const std::string& image_path, const std::string& log_path,
                const std::string& export_type, bool print_handoff) {
    bdsm::config::Options opts = base;
    opts.filename = image_path;
    bdsm::image::Image img(opts);

    const fs::path log_file = log_path.empty() ? fs::path(image_path + ".pybdsm.log") : fs::path(log_path);
    std::ofstream log(log_file, std::ios::app);
    if (!log) {
        std::cerr << "[CLI] Cannot open log file " << log_file << std::endl;
        return 1;
    }
    img.set_log_stream(&log);

    img.process(overrides);

    if (!export_type.empty()) {
        YAML::Node eo;
        eo["img_type"] = export_type;
        eo["clobber"] = true;
        img.export_image(eo);
    }

    if (print_handoff) {
        print_json(json(img.get_state()));
    }
    return 0;
}

// ============================================================================
// shell [image] [--config P]
// ============================================================================
static void print_shell_help() {
    std::cout << "Commands:\n"
              << "  set key=value [key=value ...]  Change options\n"
              << "  pars                           List options\n"
              << "  process                        Run the pipeline\n"
              << "  save [file]                    Save options\n"
              << "  load [file]                    Load options\n"
              << "  export [img_type] [file]       Write a map as FITS\n"
              << "  catalog [format] [type]        Write the Gaussian or source list\n"
              << "  show [ngaus]                   Summarize the fit results\n"
              << "  maps                           List the available maps\n"
              << "  state                          Print the handoff state\n"
              << "  quit                           Leave the shell\n";
}

int cmd_shell(const bdsm::config::Options& base, const std::string& image_path) {
    bdsm::config::Options opts = base;
    if (!image_path.empty()) opts.filename = image_path;

    bdsm::image::Image img(opts);
    img.set_interactive(true);

    std::cout << "bdsm interactive shell; type 'help' for commands" << std::endl;
    std::string line;
    while (std::cout << "BDSM> " << std::flush, std::getline(std::cin, line)) {
        const auto words = bdsm::core::split(bdsm::core::trim(line), ' ');
        std::vector<std::string> args;
        for (const auto& w : words) {
            if (!w.empty()) args.push_back(w);
        }
        if (args.empty()) continue;

        const std::string& cmd = args[0];
        auto arg = [&](std::size_t i) -> std::string { return i < args.size() ? args[i] : ""; };

        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            print_shell_help();
        } else if (cmd == "set") {
            YAML::Node overrides;
            try {
                for (std::size_t i = 1; i < args.size(); ++i) add_override(overrides, args[i]);
            } catch (const std::exception& e) {
                std::cout << "\n\033[31;1mERROR\033[0m: " << e.what() << std::endl;
                continue;
            }
            img.set_pars(overrides);
        } else if (cmd == "pars") {
            img.list_pars();
        } else if (cmd == "process") {
            img.process();
        } else if (cmd == "save") {
            img.save_pars(arg(1));
        } else if (cmd == "load") {
            img.load_pars(arg(1));
        } else if (cmd == "export") {
            YAML::Node eo;
            if (!arg(1).empty()) eo["img_type"] = arg(1);
            if (!arg(2).empty()) eo["outfile"] = arg(2);
            eo["clobber"] = true;
            if (auto out = img.export_image(eo)) std::cout << "Wrote " << out->string() << std::endl;
        } else if (cmd == "catalog") {
            YAML::Node co;
            if (!arg(1).empty()) co["format"] = arg(1);
            if (!arg(2).empty()) co["catalog_type"] = arg(2);
            co["clobber"] = true;
            if (auto out = img.write_catalog(co)) std::cout << "Wrote " << out->string() << std::endl;
        } else if (cmd == "show") {
            YAML::Node so;
            try {
                if (!arg(1).empty()) so["ngaus"] = YAML::Load(arg(1));
            } catch (const std::exception& e) {
                std::cout << "\n\033[31;1mERROR\033[0m: " << e.what() << std::endl;
                continue;
            }
            img.show_fit(so);
        } else if (cmd == "maps") {
            for (auto id : img.available_maps()) std::cout << "  " << bdsm::map_id_to_string(id) << "\n";
            std::cout << std::flush;
        } else if (cmd == "state") {
            bdsm::core::Status st = bdsm::core::run_guarded([&] { print_json(json(img.get_state())); });
            if (!st.success) std::cout << "\n\033[31;1mERROR\033[0m: " << st.error_message << std::endl;
        } else {
            std::cout << "Unknown command '" << cmd << "'; type 'help' for commands" << std::endl;
        }
    }
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: bdsm <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                        Print JSON schema for the options\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate an options file\n"
              << "  list-pars [--config P] [--set k=v]  List options\n"
              << "  save-pars <file> [--config P] [--set k=v]  Save options\n"
              << "  process <image> [--config P] [--set k=v] [--log P]\n"
              << "          [--export TYPE] [--handoff]  Process an image\n"
              << "  shell [image] [--config P]        Interactive session\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            std::string yaml = get_arg("--yaml");
            bool use_stdin = has_flag("--stdin");
            if (path.empty() && yaml.empty() && !use_stdin) {
                std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
                return 1;
            }
            return cmd_validate_config(path, yaml, use_stdin);
        }

        YAML::Node overrides;
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], "--set") == 0) {
                add_override(overrides, argv[++i]);
            }
        }
        const bdsm::config::Options base = base_options(get_arg("--config"));

        if (command == "list-pars") {
            return cmd_list_pars(base, overrides);
        }

        if (command == "save-pars") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "save-pars requires a file argument\n";
                return 1;
            }
            return cmd_save_pars(base, overrides, path);
        }

        if (command == "process") {
            std::string image_path = get_positional(0);
            if (image_path.empty()) {
                std::cerr << "process requires an image argument\n";
                return 1;
            }
            return cmd_process(base, overrides, image_path, get_arg("--log"), get_arg("--export"),
                               has_flag("--handoff"));
        }

        if (command == "shell") {
            return cmd_shell(base, get_positional(0));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    print_usage();
    return 1;
}
