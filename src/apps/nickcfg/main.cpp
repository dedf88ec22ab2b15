// File: src/apps/nickcfg/main.cpp
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include "nick/core/candidates.hpp"
#include "nick/core/configuration.hpp"
#include "nick/core/loader.hpp"
#include "nick/core/resolver.hpp"
#include "nick/core/scalar_tags.hpp"

namespace {

struct Args {
  std::string app;
  std::optional<std::filesystem::path> config_path;
  std::string command;
  bool help{false};
  bool bad_usage{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--app" && i + 1 < argc) {
      a.app = argv[++i];
      continue;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = std::filesystem::path(argv[++i]);
      continue;
    }
    if (a.command.empty() && !s.empty() && s[0] != '-') {
      a.command = s;
      continue;
    }
    std::cerr << "Unexpected argument: " << s << "\n";
    a.bad_usage = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "nickcfg --app <name> [--config <path>] <command>\n"
            << "\n"
            << "commands:\n"
            << "  candidates   list every location searched, in order\n"
            << "  locate       print the configuration file that would be loaded\n"
            << "  eval         evaluate the configuration and print it as YAML\n";
}

// Scalar tags only steer decoding; print plain YAML and quote Strings so
// "80" stays distinguishable from 80.
void emit(YAML::Emitter& out, const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Sequence:
      out << YAML::BeginSeq;
      for (const auto& item : node) emit(out, item);
      out << YAML::EndSeq;
      break;
    case YAML::NodeType::Map:
      out << YAML::BeginMap;
      for (const auto& kv : node) {
        out << YAML::Key << kv.first.Scalar() << YAML::Value;
        emit(out, kv.second);
      }
      out << YAML::EndMap;
      break;
    case YAML::NodeType::Scalar:
      if (node.Tag() == nick::kStrTag) out << YAML::DoubleQuoted;
      out << node.Scalar();
      break;
    default:
      out << YAML::Null;
      break;
  }
}

int run_candidates(const Args& args) {
  nick::FilesystemProbe probe;
  for (const auto& candidate : nick::all_location_candidates(args.app)) {
    std::cout << (probe.is_regular_file(candidate) ? "* " : "  ") << candidate.string() << "\n";
  }
  return 0;
}

int run_locate(const Args& args) {
  const auto source = nick::resolve_config_source(args.app, args.config_path);
  std::cout << (source ? source->string() : std::string("<default>")) << "\n";
  return 0;
}

int run_eval(const Args& args) {
  const auto source = nick::resolve_config_source(args.app, args.config_path);
  if (!source) {
    std::cout << "# no configuration found; defaults apply\n{}\n";
    return 0;
  }

  auto tree_r = nick::load<YAML::Node>(*source, std::cerr);
  if (!tree_r.ok()) {
    std::cerr << tree_r.error().message() << "\n";
    return 1;
  }

  YAML::Emitter out;
  emit(out, tree_r.value());
  std::cout << "# " << source->string() << "\n" << out.c_str() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help) {
    print_usage();
    return 0;
  }
  if (args.bad_usage || args.command.empty()) {
    print_usage();
    return 2;
  }

  if (args.command == "candidates") return run_candidates(args);
  if (args.command == "locate") return run_locate(args);
  if (args.command == "eval") return run_eval(args);

  std::cerr << "Unknown command: " << args.command << "\n";
  print_usage();
  return 2;
}
