#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/io/change_loader.hpp"
#include "internal/io/flow_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using fabplan::observability::IntField;
using fabplan::observability::StringField;

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitUsage       = 1;
constexpr int kExitFatal       = 2;
constexpr int kExitUnavailable = 3;

void PrintUsage() {
  std::cerr << "Usage: fabplan --config <config.yaml> --changes <changes.yaml> [--output <flow.json>]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string changes_path;
  std::string output_path;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      PrintUsage();
      return kExitOk;
    }
    if (i + 1 >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    if (arg == "--config") {
      config_path = argv[++i];
    } else if (arg == "--changes") {
      changes_path = argv[++i];
    } else if (arg == "--output") {
      output_path = argv[++i];
    } else {
      std::cerr << "unknown argument: " << arg << std::endl;
      PrintUsage();
      return kExitUsage;
    }
  }

  if (config_path.empty() || changes_path.empty()) {
    PrintUsage();
    return kExitUsage;
  }

  fabplan::runtime::config::Config config;
  try {
    config = fabplan::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "fabplan: " << e.what() << std::endl;
    return kExitFatal;
  }

  fabplan::observability::InitializeLogging(config);

  int exit_code = kExitOk;
  try {
    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app   = fabplan::factory::Build(config);
    auto input = fabplan::io::LoadChangeSequence(changes_path);

    // ------------------------------------------------------------
    // Plan and emit
    // ------------------------------------------------------------
    auto result = app.orchestrator->Plan(std::move(input.changes), input.layouts);

    for (const auto& diagnostic : result.diagnostics) {
      FABPLAN_LOG_WARN("Planning gap", {IntField("order_index", diagnostic.order_index),
                                        StringField("reason", fabplan::model::ToString(diagnostic.reason)),
                                        StringField("detail", diagnostic.detail)});
    }

    if (output_path.empty()) {
      std::cout << fabplan::io::FlowToJson(result.flow) << std::flush;
    } else {
      fabplan::io::WriteFlowJson(output_path, result.flow);
      FABPLAN_LOG_INFO("Flow written", {StringField("path", output_path), IntField("steps", static_cast<std::int64_t>(result.flow.size()))});
    }
  } catch (const fabplan::util::CollaboratorUnavailable& e) {
    FABPLAN_LOG_ERROR("Collaborator unavailable, retry later", {StringField("collaborator", e.Collaborator()), StringField("error", e.what())});
    exit_code = kExitUnavailable;
  } catch (const fabplan::util::FlowFailed& e) {
    FABPLAN_LOG_ERROR("No flow produced", {IntField("order_index", e.OrderIndex()), StringField("state", e.State()),
                                           StringField("cause", e.Cause())});
    exit_code = kExitFatal;
  } catch (const std::exception& e) {
    FABPLAN_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    exit_code = kExitFatal;
  }

  fabplan::observability::ShutdownLogging();
  return exit_code;
}
