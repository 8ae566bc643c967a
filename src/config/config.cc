#include "config.hpp"

#include <config_parser/config_parser.hpp>
#include <config_parser/config_parser_utils.hpp>

#include <fmt/format.h>
#include <sago/platform_folders.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

using diffy::ParseErrorKind;
using diffy::ParseResult;
using diffy::Value;

static std::string config_doc_general = R"foo(# Configuration for ´phabstack´
#
# Defaults for the command-line options, which override them.
#
#   log_level: trace, debug, info, warn, error or off
#   ref:       the ref whose history is published and rewritten
#
)foo";

enum class ConfigVariableType {
    Bool,
    String,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
phabstack::config_get_directory() {
    return fmt::format("{}/phabstack", sago::getConfigHome());
}

static ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return config_table.is_table() ? ConfigLoadResult::Ok : ConfigLoadResult::Invalid;
    }
    return load_result.kind == ParseErrorKind::File ? ConfigLoadResult::DoesNotExist : ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_path, Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        spdlog::warn("could not write '{}': {}", config_path, strerror(errno));
        return;
    }

    std::string serialized = cfg_serialize(config_value);
    fwrite(serialized.c_str(), serialized.size(), 1, f);
    fclose(f);
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static bool
config_apply_options(Value& config, const OptionVector& options, phabstack::Status& status) {
    for (const auto& [path, type, ptr] : options) {
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            Value& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (!value.is_bool()) {
                        return status.set_error(phabstack::ErrorKind::User,
                                                fmt::format("config: '{}' must be true or false", path));
                    }
                    *((bool*) ptr) = value.as_bool();
                } break;
                case ConfigVariableType::String: {
                    if (!value.is_string()) {
                        return status.set_error(phabstack::ErrorKind::User,
                                                fmt::format("config: '{}' must be a string", path));
                    }
                    *((std::string*) ptr) = value.as_string();
                } break;
            }
        } else {
            // Not in the file yet, so store the default.
            switch (type) {
                case ConfigVariableType::Bool: {
                    Value v{Value::Bool{*(bool*) ptr}};
                    config.set_value_at(path, v);
                } break;
                case ConfigVariableType::String: {
                    Value v{Value::String{*(std::string*) ptr}};
                    config.set_value_at(path, v);
                } break;
            }
        }
    }
    return true;
}

bool
phabstack::config_apply_options(ProgramOptions& program_options, Status& status) {
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/phabstack.conf", config_root);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value{Value::Table{}};
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok:
            break;
        case ConfigLoadResult::Invalid:
            return status.set_error(ErrorKind::User,
                                    fmt::format("{}\n\twhile parsing: {}", config_parse_result.error, config_path));
        case ConfigLoadResult::DoesNotExist:
            spdlog::debug("no config file, creating {}", config_path);
            config_file_table_value = Value{Value::Table{}};
            flush_config_to_disk = true;
            break;
    }

    // clang-format off
    const OptionVector options = {
        { "general.log_level",   ConfigVariableType::String, &program_options.log_level },
        { "general.ref",         ConfigVariableType::String, &program_options.ref },
        { "git.command",         ConfigVariableType::String, &program_options.git_command },
        { "phabricator.url",     ConfigVariableType::String, &program_options.phabricator_url },
        { "cinnabar.enabled",    ConfigVariableType::Bool,   &program_options.cinnabar },
    };
    // clang-format on

    if (!::config_apply_options(config_file_table_value, options, status)) {
        return false;
    }

    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(config_doc_general);
        config_save(config_root, config_path, config_file_table_value);
    }
    return true;
}
