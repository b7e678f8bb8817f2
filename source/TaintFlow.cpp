/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <iostream>

#include <taintflow/JsonReaderWriter.h>
#include <taintflow/KindFactory.h>
#include <taintflow/Log.h>
#include <taintflow/Options.h>
#include <taintflow/TaintDeclarations.h>
#include <taintflow/TaintFlow.h>

namespace program_options = boost::program_options;

namespace taintflow {

void TaintFlow::add_options(
    program_options::options_description& options) const {
  options.add_options()(
      "verbosity,v",
      program_options::value<int>(),
      "Logging level, overrides the `verbosity` of the configuration.");
}

void TaintFlow::run(const program_options::variables_map& variables) {
  auto configuration =
      JsonReader::parse_json_file(variables["config"].as<std::string>());
  if (variables.count("verbosity")) {
    configuration["verbosity"] = variables["verbosity"].as<int>();
  }

  auto context = make_context(configuration);
  const auto& options = *context.options;

  if (const auto& output_path = options.output_path()) {
    LOG(1, "Writing declarations to `{}`.", *output_path);
    JsonWriter::write_json_file(*output_path, context.declarations->to_json());
  } else {
    write_declarations(context, std::cout);
  }

  if (const auto& header = options.request_header()) {
    StreamOutputSink sink(std::cout);
    auto result = handle_request(*header, sink);
    if (result.is_failure()) {
      WARNING(1, "Request failed: {}", result.error());
    }
  }
}

Context TaintFlow::make_context(const Json::Value& configuration) {
  Context context;
  context.options = std::make_unique<Options>(configuration);
  if (const auto& verbosity = context.options->verbosity()) {
    Logger::set_level(*verbosity);
  }
  load_declarations(context);
  return context;
}

void TaintFlow::load_declarations(Context& context) {
  declare_pipeline(*context.declarations, *context.kind_factory);
  context.declarations->join_with(TaintDeclarations::load(
      context.options->declarations_paths(), *context.kind_factory));
  LOG(1,
      "Registered {} sinks and {} sources using {} kinds.",
      context.declarations->sinks().size(),
      context.declarations->sources().size(),
      context.declarations->used_kinds().size());
}

void TaintFlow::write_declarations(
    const Context& context,
    std::ostream& output) {
  output << JsonWriter::to_styled_string(context.declarations->to_json())
         << "\n";
}

RequestHandler::ResultType TaintFlow::handle_request(
    const std::string& header,
    OutputSink& sink) {
  RequestValidator validator(RequestArgs{header});
  RequestHandler handler(validator, sink);
  return handler.get_validated_input().get();
}

} // namespace taintflow
