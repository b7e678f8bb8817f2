/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>
#include <string>

#include <boost/program_options.hpp>
#include <json/json.h>

#include <taintflow/Context.h>
#include <taintflow/OutputSink.h>
#include <taintflow/RequestHandler.h>

namespace taintflow {

/**
 * The `taintflow` command: builds the declaration registry from the pipeline
 * markers and the configured declaration files, writes it as json, and
 * optionally runs the request pipeline on a header value.
 */
class TaintFlow final {
 public:
  TaintFlow() = default;

  void add_options(boost::program_options::options_description& options) const;
  void run(const boost::program_options::variables_map& variables);

  /* Build a context for the given configuration, with all declarations. */
  static Context make_context(const Json::Value& configuration);

  /* Register the pipeline markers, then join the configured files. */
  static void load_declarations(Context& context);

  static void write_declarations(const Context& context, std::ostream& output);

  /* Serve one request whose `a` argument is the given header value. */
  static RequestHandler::ResultType handle_request(
      const std::string& header,
      OutputSink& sink);
};

} // namespace taintflow
